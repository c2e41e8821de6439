#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <vector>

#include <boost/program_options.hpp>
namespace po = boost::program_options;

#include <fmt/core.h>
#include <fmt/os.h>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <spdlog/stopwatch.h>

#include "nbrank/metric_spec.hpp"
#include "nbrank/reranker.hpp"

#include "io_helper.hpp"
#include "rerank_streams.hpp"

using namespace nbrank;

struct RerankArguments {
    std::filesystem::path reference_file;
    std::filesystem::path hypotheses_file;
    std::optional<std::filesystem::path> opt_output_file;
    std::string metric;
    double isometric_alpha;
    bool return_score;
    RerankOutputOptions output_options;
};

static bool process_command_line(const std::vector<std::string> & args,
                                 RerankArguments & arguments) {
    auto print_soft_name = []() {
        fmt::print("nbrank - n-best list reranking\nVersion: {} (built on {})\n\n",
                   PROJECT_VERSION, __DATE__);
    };
    auto print_usage = []() {
        fmt::print(R"(Usage:
  nbrank_rerank --help
  nbrank_rerank --list-metrics
  nbrank_rerank <reference> <hypotheses> [<parameters> ...]

Reranking sorts the hypotheses of each n-best list according to their score
compared to a common reference or source sentence.

)");
    };

    auto print_available_metrics = []() {
        fmt::println("Available metrics:");
        const std::size_t metric_name_max_length = std::ranges::max(
            std::ranges::views::transform(metric_descriptions, [](auto && m) {
                return m.name.size();
            }));
        const std::size_t offset = metric_name_max_length + 8;

        for(auto && m : metric_descriptions) {
            fmt::print("  {:<{}}", m.name, offset - 2);
            print_paragraph(offset, 80 - offset, std::string(m.description));
        }
        fmt::print("Metrics starting with '{}' rank by source length "
                   "compliance.\n\n",
                   isometric_prefix);
    };

    po::options_description desc("Allowed parameters");
    desc.add_options()("help,h", "Display this help message")(
        "list-metrics,M", "List the available metrics")(
        "reference,r", po::value<std::filesystem::path>()->required(),
        "File with one reference translation per line, '-' for stdin")(
        "hypotheses,H", po::value<std::filesystem::path>()->required(),
        "File with one n-best JSON object per line, '-' for stdin")(
        "metric,m", po::value<std::string>()->default_value("bleu"),
        "Sentence-level metric used to rerank")(
        "isometric-alpha", po::value<double>()->default_value(0.5),
        "Weight of the length criterion in the isometric metrics, in [0,1]")(
        "output,o", po::value<std::filesystem::path>(),
        "Output file, stdout if omitted")(
        "output-best", "Output only the best hypothesis of each line")(
        "output-best-non-blank",
        "With --output-best, replace a blank best hypothesis by the next "
        "non-blank one")("output-reference-instead-of-blank,b",
                         "With --output-best, replace a blank best "
                         "hypothesis by the reference")(
        "return-score",
        "Add the sorted metric scores and the best score to the output JSON")(
        "verbose,v", "Enable trace logging")(
        "quiet,q", "Silence all logging except errors");

    po::positional_options_description p;
    p.add("reference", 1);
    p.add("hypotheses", 1);
    po::variables_map vm;
    po::store(po::command_line_parser(args).options(desc).positional(p).run(),
              vm);

    if(vm.count("help") || args.empty()) {
        print_soft_name();
        print_usage();
        std::cout << desc << std::endl;
        print_available_metrics();
        return false;
    }

    if(vm.count("list-metrics")) {
        print_soft_name();
        print_available_metrics();
        return false;
    }

    po::notify(vm);
    arguments.reference_file = vm["reference"].as<std::filesystem::path>();
    arguments.hypotheses_file = vm["hypotheses"].as<std::filesystem::path>();
    check_input_files(arguments.reference_file, arguments.hypotheses_file);
    if(vm.count("output"))
        arguments.opt_output_file.emplace(
            vm["output"].as<std::filesystem::path>());
    arguments.metric = vm["metric"].as<std::string>();
    arguments.isometric_alpha = vm["isometric-alpha"].as<double>();
    arguments.return_score = vm.count("return-score") > 0;
    RerankOutputOptions & output_options = arguments.output_options;
    output_options.output_best = vm.count("output-best") > 0;
    output_options.blank_policy.reference_instead_of_blank =
        vm.count("output-reference-instead-of-blank") > 0;
    output_options.blank_policy.best_non_blank =
        vm.count("output-best-non-blank") > 0;
    if(has_ignored_blank_fallbacks(output_options))
        spdlog::warn("Blank hypothesis fallbacks only apply with '--output-best'");

    if(vm.count("quiet")) {
        spdlog::set_level(spdlog::level::err);
    } else if(vm.count("verbose")) {
        spdlog::set_level(spdlog::level::trace);
    } else {
        spdlog::set_level(spdlog::level::info);
    }

    return true;
}

int main(int argc, const char * argv[]) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("nbrank"));
    spdlog::set_pattern("[%^%l%$] %v");
    std::string program_state = "Parsing arguments";

    try {
        RerankArguments arguments;
        std::vector<std::string> args(argv + 1, argv + argc);
        if(!process_command_line(args, arguments)) return EXIT_SUCCESS;
        spdlog::info("nbrank version {}", PROJECT_VERSION);

        program_state = "Creating reranker";
        auto event_sink = std::make_shared<SpdlogEventSink>();
        const Reranker reranker(arguments.metric, arguments.isometric_alpha,
                                arguments.return_score, nullptr, event_sink);
        spdlog::info("Hypotheses re-ranking using criterion: '{}'",
                     reranker.metric().name);

        program_state = "Opening inputs";
        auto reference_input = open_input(arguments.reference_file);
        auto hypotheses_input = open_input(arguments.hypotheses_file);
        std::optional<fmt::ostream> opt_output;
        if(arguments.opt_output_file.has_value())
            opt_output.emplace(fmt::output_file(
                arguments.opt_output_file.value().string().c_str()));
        auto emit = [&opt_output](const std::string & str) {
            if(opt_output.has_value())
                opt_output->print("{}\n", str);
            else
                fmt::println("{}", str);
        };

        program_state = "Reranking";
        spdlog::stopwatch sw;
        const RerankStreamsResult streams_result = rerank_streams(
            *reference_input, *hypotheses_input, reranker,
            arguments.output_options, *event_sink, emit);

        const auto computation_time_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(sw.elapsed())
                .count();
        spdlog::info("Reranked {} lines in {} ms", streams_result.num_lines,
                     computation_time_ms);
        if(arguments.opt_output_file.has_value()) {
            opt_output->close();
            spdlog::info("Output written to '{}'",
                         std::filesystem::absolute(
                             arguments.opt_output_file.value())
                             .string());
        }
    } catch(const std::exception & e) {
        spdlog::error("{}: {}", program_state, e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
