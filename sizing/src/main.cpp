#include <Kokkos_Core.hpp>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <highfive/H5File.hpp>

#include "argument_parser.hpp"
#include "case_io.hpp"
#include "fill_sweep.hpp"
#include "sizing.hpp"

using namespace prd;

namespace {

void print_case(const std::string& filename, const SizingCase& input) {
    const VesselGeometry& g = input.geometry;
    std::cout << "Case file: " << filename << std::endl;
    std::cout << "  Head type:            " << to_string(g.head_type) << std::endl;
    std::cout << "  Outer diameter:       " << g.outer_diameter << " m" << std::endl;
    std::cout << "  Shell height:         " << g.shell_height << " m" << std::endl;
    std::cout << "  Shell thickness:      " << g.shell_thickness / M_PER_MM << " mm" << std::endl;
    std::cout << "  Bottom elevation:     " << g.bottom_elevation << " m" << std::endl;
    std::cout << "  Fill volume:          " << input.fill.volume << " m^3" << std::endl;
    std::cout << "  k / M / Z:            " << input.fluid.k << " / " << input.fluid.molecular_weight
              << " / " << input.fluid.Z << std::endl;
    std::cout << "  h_fg:                 " << input.fluid.h_fg / J_PER_KJ << " kJ/kg" << std::endl;
    std::cout << "  Relieving temp.:      " << input.fluid.relieving_temperature << " K" << std::endl;
    std::cout << "  MAWP / operating:     " << input.relief.MAWP << " / " << input.relief.operating_pressure
              << " psig" << std::endl;
    std::cout << "  Backpressure:         " << input.relief.backpressure << " psig" << std::endl;
    std::cout << "  Accumulation:         " << input.relief.accumulation_percent << " %" << std::endl;
    std::cout << "  Firefighting:         " << (input.relief.firefighting ? "yes" : "no") << std::endl;
    std::cout << "  Kd / Kb / Kc / Ke:    " << input.relief.Kd << " / " << input.relief.Kb << " / "
              << input.relief.Kc << " / " << input.relief.Ke << std::endl;
}

void print_result(const SizingResult& result) {
    std::cout << std::fixed << std::setprecision(4);
    std::cout << "Method:                 " << to_string(result.method) << std::endl;
    std::cout << "Fire height limit:      " << result.fire_height_limit << " m" << std::endl;
    std::cout << "Vessel volume:          " << result.exposure.total_volume << " m^3" << std::endl;
    std::cout << "Liquid height:          " << result.exposure.liquid_height << " m" << std::endl;
    std::cout << "Exposed height:         " << result.exposure.exposed_height << " m" << std::endl;
    std::cout << "Wetted area:            " << result.exposure.wetted_area << " m^2" << std::endl;
    std::cout << "Heat load:              " << result.heat_load << " W" << std::endl;
    std::cout << "Evaporation rate:       " << result.evaporation_rate << " kg/s ("
              << result.mass_flow << " lb/h)" << std::endl;
    std::cout << "Relieving pressure:     " << result.conditions.relieving_pressure << " psia" << std::endl;
    std::cout << "Critical pressure:      " << result.conditions.critical_pressure << " psia" << std::endl;
    std::cout << "Flow regime:            " << to_string(result.conditions.regime) << std::endl;
    std::cout << "Required area:          " << result.required_area << " in^2" << std::endl;
    if (result.orifice) {
        std::cout << "Selected orifice:       " << result.orifice->letter << " (" << result.orifice->area
                  << " in^2, " << result.orifice->diameter << " in)" << std::endl;
        std::cout << "Minimum inlet size:     " << result.orifice->inlet_size << " in" << std::endl;
    } else {
        std::cout << "Selected orifice:       " << UNSIZED_ORIFICE << std::endl;
    }
}

template <typename ExecutionSpace>
void run_fill_sweep(const std::string& case_file, const SizingCase& input, double fire_height_limit,
                    size_t npoints, std::optional<HighFive::File>& output) {
    using Sweep = FillSweep<ExecutionSpace>;
    Sweep sweep(input.geometry, fire_height_limit);

    auto volumes = read_sweep_volumes<typename Sweep::View1D>(case_file);
    if (volumes.extent(0) == 0) {
        volumes = sweep.uniform_fill_volumes(npoints);
    }

    std::cout << "Running fill sweep over " << volumes.extent(0) << " points on "
              << ExecutionSpace::name() << std::endl;
    typename Sweep::Result result = sweep.run(volumes);

    if (output) {
        write_sweep<ExecutionSpace>(*output, result);
    }
}

} // namespace

int main(int argc, char* argv[]) {
  Kokkos::initialize(argc, argv);
  int status = 0;
  {
    ArgumentParser parser = ArgumentParser::prd_fire_sizing_parser(argv[0]);

    if (!parser.parse(argc, argv)) {
        Kokkos::finalize();
        return 1;
    }

    bool verbose = parser.get_flag("verbose");
    std::string case_file = parser.get_positional(0);
    std::string output_file = parser.get_option("output");
    std::string device = parser.get_option("device");

    try {
        size_t sweep_points = parser.get_count("sweep_points");
        size_t profile_points = parser.get_count("profile_points");

        SizingCase input = read_case(case_file);
        if (verbose) {
            print_case(case_file, input);
        }

        SizingResult result = size_for_fire(input);
        print_result(result);

        std::optional<HighFive::File> output;
        if (!output_file.empty()) {
            output.emplace(output_file, HighFive::File::Overwrite);
            write_result(*output, result);
        }

        if (sweep_points > 0 || has_sweep_volumes(case_file)) {
            if (device == "serial") {
#ifdef KOKKOS_ENABLE_SERIAL
                run_fill_sweep<Kokkos::Serial>(case_file, input, result.fire_height_limit, sweep_points, output);
#else
                throw std::runtime_error("Serial execution space not enabled in Kokkos!");
#endif
            } else if (device == "openmp") {
#ifdef KOKKOS_ENABLE_OPENMP
                run_fill_sweep<Kokkos::OpenMP>(case_file, input, result.fire_height_limit, sweep_points, output);
#else
                throw std::runtime_error("OpenMP execution space not enabled in Kokkos!");
#endif
            } else {
                throw std::runtime_error("Unsupported Kokkos execution space: " + device);
            }
        }

        if (profile_points > 0) {
            VesselModel vessel(input.geometry);
            HeadProfile profile = sample_head_profile(vessel.head(), profile_points);
            if (verbose) {
                std::cout << "Sampled " << profile_points << " points of the " << to_string(vessel.head().type())
                          << " head profile" << std::endl;
            }
            if (output) {
                write_profile(*output, profile);
            }
        }

        if (output) {
            output->flush();
            std::cout << "Results written to " << output_file << std::endl;
        }
    } catch (const HighFive::Exception& e) {
        std::cerr << "[ERROR] HDF5: " << e.what() << std::endl;
        status = 1;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << std::endl;
        status = 1;
    }
  }
  Kokkos::finalize();
  return status;
}
