/**
 * @file main.cpp
 * @brief Command-line driver for the sounding forward model
 *
 * Runs the reference seven-layer Schlumberger sounding and prints the
 * resulting table. Optional arguments: relative noise level and seed.
 *
 *   vesmod_cli [relative_std [seed]]
 */

#include <chrono>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "forward_simulation.hpp"
#include "noise_model.hpp"

int main(int argc, char** argv) {
    std::cout << "VESMod 1D DC Resistivity Forward Model\n";
    std::cout << "Version 0.1.0\n";
    std::cout << "======================================\n\n";

    try {
        vesmod::NoiseConfig noise;
        if (argc > 1) {
            noise.relative_std = std::stod(argv[1]);
            noise.enabled = noise.relative_std > 0.0;
        }
        if (argc > 2) {
            noise.seed = static_cast<std::uint64_t>(std::stoull(argv[2]));
        }

        // Reference model
        const std::vector<double> resistivities = {400.0, 50.0, 400.0, 200.0, 2000.0, 20.0, 2000.0};
        const std::vector<double> thicknesses = {8.0, 8.0, 4.0, 10.0, 10.0, 10.0};
        vesmod::LayerStack model(resistivities, thicknesses);

        std::cout << "Layers: " << model.n_layers()
                  << ", depth to half-space: " << model.total_thickness() << " m\n";

        // Log-spaced Schlumberger sounding, AB/2 from 5 m to 400 m
        const size_t n_soundings = 29;
        std::vector<double> ab2(n_soundings), mn2(n_soundings);
        for (size_t i = 0; i < n_soundings; ++i) {
            ab2[i] = 5.0 * std::pow(80.0, static_cast<double>(i) / (n_soundings - 1));
            mn2[i] = ab2[i] / 10.0;
        }
        vesmod::ForwardSimulation simulation(vesmod::Survey::schlumberger(ab2, mn2));

        std::cout << "Hankel filter: " << simulation.filter().size() << " taps\n";
        std::cout << "Soundings: " << simulation.survey().n_data() << "\n";
        if (noise.enabled) {
            std::cout << "Noise: " << 100.0 * noise.relative_std << " %\n";
        }
        std::cout << "\n";

        auto start = std::chrono::high_resolution_clock::now();
        vesmod::DataSet data = vesmod::make_synthetic_data(simulation, model, noise);
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::high_resolution_clock::now() - start);

        const std::vector<std::string> columns = data.column_names();
        for (const auto& name : columns) {
            std::cout << std::setw(22) << name;
        }
        std::cout << "\n";

        const Eigen::MatrixXd table = data.to_table();
        std::cout << std::fixed << std::setprecision(4);
        for (Eigen::Index i = 0; i < table.rows(); ++i) {
            for (Eigen::Index j = 0; j < table.cols(); ++j) {
                std::cout << std::setw(22) << table(i, j);
            }
            std::cout << "\n";
        }

        std::cout << "\nForward run: " << elapsed.count() << " us\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
