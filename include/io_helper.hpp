#ifndef IO_HELPER_HPP
#define IO_HELPER_HPP

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/iostreams/device/file.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <fmt/core.h>

#include <spdlog/spdlog.h>

#include "nbrank/event_sink.hpp"

namespace nbrank {

inline void print_paragraph(std::size_t offset, std::size_t column_width,
                            const std::string & str) {
    std::size_t line_start = 0;
    while(str.size() - line_start > column_width) {
        std::size_t n = str.rfind(' ', line_start + column_width);
        if(n <= line_start) {
            fmt::print("{}-\n{: ^{}}", str.substr(line_start, column_width - 1),
                       "", offset);
            line_start += column_width - 1;
        } else {
            fmt::print("{}\n{: ^{}}", str.substr(line_start, n - line_start),
                       "", offset);
            line_start = n + 1;
        }
    }
    fmt::println("{}", str.substr(line_start));
}

/**
 * @brief Opens a text input for reading.
 *
 * "-" designates the standard input and files with the ".gz" extension are
 * decompressed on the fly.
 */
inline std::unique_ptr<std::istream> open_input(
    const std::filesystem::path & path) {
    auto input = std::make_unique<boost::iostreams::filtering_istream>();
    if(path == "-") {
        input->push(std::cin);
        return input;
    }
    if(!std::filesystem::exists(path))
        throw std::invalid_argument("File '" + path.string() +
                                    "' does not exist");
    if(std::filesystem::is_directory(path))
        throw std::invalid_argument("'" + path.string() + "' is a directory");

    boost::iostreams::file_source file(path.string(),
                                       std::ios_base::in | std::ios_base::binary);
    if(!file.is_open())
        throw std::runtime_error("'" + path.string() + "' not opened");
    if(path.extension() == ".gz")
        input->push(boost::iostreams::gzip_decompressor());
    input->push(file);
    return input;
}

class SpdlogEventSink : public RerankEventSink {
public:
    void no_op(std::size_t line, std::size_t num_hypotheses) {
        spdlog::info("Line {} contains {} hypotheses. Nothing to rerank.",
                     line, num_hypotheses);
    }
    void replaced_by_reference(std::size_t line) {
        spdlog::warn("Line {}: replacing blank hypothesis with reference.",
                     line);
    }
    void replaced_by_non_blank(std::size_t line, std::size_t index,
                               const std::string & hypothesis) {
        spdlog::warn(
            "Line {}: blank hypothesis replaced by non-blank hypothesis [{}]: "
            "{}",
            line, index, hypothesis);
    }
};

}  // namespace nbrank

#endif  // IO_HELPER_HPP
