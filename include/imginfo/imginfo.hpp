#ifndef IMGINFO_IMGINFO_HPP_
#define IMGINFO_IMGINFO_HPP_

#include <imginfo/imginfo_export.h>
#include <imginfo/types.hpp>
#include <imginfo/image_metadata.hpp>
#include <imginfo/byte_source.hpp>
#include <imginfo/log.hpp>
#include <imginfo/probe.hpp>
#include <imginfo/checkers/gif.hpp>
#include <imginfo/checkers/png.hpp>
#include <imginfo/checkers/jpeg.hpp>
#include <imginfo/checkers/bmp.hpp>
#include <imginfo/checkers/pcx.hpp>
#include <imginfo/checkers/iff.hpp>
#include <imginfo/checkers/sunrast.hpp>
#include <imginfo/checkers/pnm.hpp>
#include <imginfo/checkers/psd.hpp>

#endif // IMGINFO_IMGINFO_HPP_
