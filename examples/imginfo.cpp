#include <imginfo/imginfo.hpp>

#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [options] [image_file...]\n";
    std::cerr << "Prints format, size, depth and resolution of image files.\n";
    std::cerr << "Reads standard input when no file is given.\n\n";
    std::cerr << "Options:\n";
    std::cerr << "  -c, --compact      One tab separated line per file, no comments\n";
    std::cerr << "  -v, --verbose-log  Log rejected headers to stderr\n";
    std::cerr << "  -h, --help         Show this help\n";
}

void print_line(int indent, std::string_view label, std::string_view value) {
    if (value.empty()) {
        return;
    }
    for (int i = 0; i < indent; ++i) {
        std::cout << '\t';
    }
    if (!label.empty()) {
        std::cout << label << ' ';
    }
    std::cout << value << '\n';
}

void print_line(int indent, std::string_view label, int value, int min_valid) {
    if (value >= min_valid) {
        print_line(indent, label, std::to_string(value));
    }
}

void print_line(int indent, std::string_view label, const std::optional<float>& value,
                float min_valid) {
    if (value && *value >= min_valid) {
        print_line(indent, label, std::to_string(*value));
    }
}

void print_verbose(std::string_view source, const imginfo::image_metadata& info) {
    print_line(0, {}, source);
    print_line(1, "File format:", info.format_name());
    print_line(1, "MIME type:", info.mime_type());
    print_line(1, "Width (pixels):", info.width(), 1);
    print_line(1, "Height (pixels):", info.height(), 1);
    print_line(1, "Bits per pixel:", info.bits_per_pixel(), 1);
    print_line(1, "Progressive:", info.progressive() ? "yes" : "no");
    print_line(1, "Number of images:", info.number_of_images(), 1);
    print_line(1, "Physical width (dpi):", info.physical_width_dpi().value_or(-1), 1);
    print_line(1, "Physical height (dpi):", info.physical_height_dpi().value_or(-1), 1);
    print_line(1, "Physical width (inches):", info.physical_width_inch(), 1.0f);
    print_line(1, "Physical height (inches):", info.physical_height_inch(), 1.0f);

    const auto& comments = info.comments();
    print_line(1, "Number of textual comments:", static_cast<int>(comments.size()), 1);
    for (const auto& comment : comments) {
        print_line(2, {}, comment);
    }
}

void print_compact(std::string_view source, const imginfo::image_metadata& info) {
    constexpr char SEP = '\t';
    std::cout << source << SEP
              << info.format_name() << SEP
              << info.mime_type() << SEP
              << info.width() << SEP
              << info.height() << SEP
              << info.bits_per_pixel() << SEP
              << info.number_of_images() << SEP
              << info.physical_width_dpi().value_or(-1) << SEP
              << info.physical_height_dpi().value_or(-1) << SEP
              << info.physical_width_inch().value_or(-1.0f) << SEP
              << info.physical_height_inch().value_or(-1.0f) << SEP
              << (info.progressive() ? "true" : "false") << '\n';
}

bool report(std::string_view source, const imginfo::detect_result& result, bool compact) {
    if (!result) {
        std::cerr << source << ": " << imginfo::to_string(result.error);
        if (!result.message.empty()) {
            std::cerr << " (" << result.message << ")";
        }
        std::cerr << "\n";
        return false;
    }

    if (compact) {
        print_compact(source, result.metadata);
    } else {
        print_verbose(source, result.metadata);
    }
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    bool compact = false;
    std::vector<std::string> files;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--compact") == 0) {
            compact = true;
        } else if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--verbose-log") == 0) {
            imginfo::set_log_level(imginfo::log_level::debug);
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            files.emplace_back(argv[i]);
        }
    }

    imginfo::detect_options options;
    options.count_images = true;
    options.collect_comments = !compact;

    if (files.empty()) {
        imginfo::stream_byte_source src(std::cin);
        return report("<stdin>", imginfo::detect(src, options), compact) ? 0 : 1;
    }

    bool all_ok = true;
    for (const auto& file : files) {
        all_ok &= report(file, imginfo::detect_file(file, options), compact);
    }
    return all_ok ? 0 : 1;
}
