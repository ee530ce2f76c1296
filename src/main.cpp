#include "ponifit/CalibrationWorkflow.hpp"
#include "ponifit/RunConfig.hpp"
#include <cxxopts.hpp>
#include <chrono>
#include <iomanip>
#include <iostream>

using namespace ponifit;

int main(int argc, char** argv) {
    auto start_time = std::chrono::steady_clock::now();
    try {
        cxxopts::Options opts("ponifit", "Detector geometry refinement from ring points");
        opts.add_options()
            ("config", "Run configuration JSON", cxxopts::value<std::string>())
            ("points", "Observation file (overrides the configuration)", cxxopts::value<std::string>())
            ("output", "Result JSON (overrides the configuration)", cxxopts::value<std::string>())
            ("verbose", "Print optimiser progress")
            ("h,help", "Show help");

        auto cli = opts.parse(argc, argv);
        if (cli.count("help") || !cli.count("config")) {
            std::cout << opts.help() << '\n';
            return 0;
        }

        RunConfig cfg = load_run_config(cli["config"].as<std::string>());
        if (cli.count("points"))  cfg.points_path = cli["points"].as<std::string>();
        if (cli.count("output"))  cfg.output_path = cli["output"].as<std::string>();
        if (cli.count("verbose")) cfg.verbose     = true;

        const RunResult res = run_calibration(cfg);

        std::cout << "\nRefined geometry (chi2 = " << res.final_chi2 << ")\n"
                  << std::setprecision(12)
                  << "  dist       = " << res.pose.dist       << " m\n"
                  << "  poni1      = " << res.pose.poni1      << " m\n"
                  << "  poni2      = " << res.pose.poni2      << " m\n"
                  << "  rot1       = " << res.pose.rot1       << " rad\n"
                  << "  rot2       = " << res.pose.rot2       << " rad\n"
                  << "  rot3       = " << res.pose.rot3       << " rad\n"
                  << "  wavelength = " << res.pose.wavelength << " m\n";

        if (!cfg.output_path.empty())
            write_result(cfg.output_path, res);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    auto end_time = std::chrono::steady_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time).count();
    std::cout << "\nTook: " << ms / 1000.0 << "s\n";

    return 0;
}
