#include "config_loader.hpp"
#include "logging.hpp"
#include "../physics/errors.hpp"

#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <set>

namespace motor_design {
namespace utils {

namespace {

YAML::Node loadFile(const std::string& filename) {
    try {
        return YAML::LoadFile(filename);
    } catch (const YAML::BadFile&) {
        throw ConfigurationError("cannot open configuration file '" + filename + "'");
    } catch (const YAML::ParserException& e) {
        throw ConfigurationError(fmt::format("malformed YAML in '{}': {}", filename, e.what()));
    }
}

YAML::Node loadText(const std::string& text) {
    try {
        return YAML::Load(text);
    } catch (const YAML::ParserException& e) {
        throw ConfigurationError(fmt::format("malformed YAML: {}", e.what()));
    }
}

// Section lookup; a present section must be a map
YAML::Node section(const YAML::Node& root, const std::string& name) {
    if (!root.IsMap()) {
        throw ConfigurationError("configuration root must be a map");
    }
    YAML::Node node = root[name];
    if (node && !node.IsMap()) {
        throw ConfigurationError(fmt::format("section '{}' must be a map", name));
    }
    return node;
}

void warnUnknownKeys(const YAML::Node& node, const std::string& name, const std::set<std::string>& allowed) {
    if (!node || !node.IsMap()) return;
    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        if (allowed.count(key) == 0) {
            logger()->warn("ignoring unknown key '{}.{}'", name, key);
        }
    }
}

template <typename T>
std::optional<T> read(const YAML::Node& node, const std::string& name, const std::string& key, const char* expected) {
    if (!node) return std::nullopt;
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return std::nullopt;
    if (!value.IsScalar()) {
        throw ConfigurationError(fmt::format("'{}.{}' must be {}", name, key, expected));
    }
    try {
        return value.as<T>();
    } catch (const YAML::BadConversion&) {
        throw ConfigurationError(fmt::format("'{}.{}' must be {} (got '{}')", name, key, expected,
                                             value.as<std::string>()));
    }
}

std::optional<double> readDouble(const YAML::Node& node, const std::string& name, const std::string& key) {
    return read<double>(node, name, key, "a number");
}

std::optional<int> readInt(const YAML::Node& node, const std::string& name, const std::string& key) {
    return read<int>(node, name, key, "an integer");
}

std::optional<std::string> readString(const YAML::Node& node, const std::string& name, const std::string& key) {
    auto value = read<std::string>(node, name, key, "a string");
    if (value) {
        std::transform(value->begin(), value->end(), value->begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
    return value;
}

[[noreturn]] void badChoice(const std::string& where, const std::string& value, const std::string& choices) {
    throw ConfigurationError(fmt::format("'{}' must be one of {} (got '{}')", where, choices, value));
}

PropellantKind parseKind(const std::string& value) {
    if (value == "hybrid") return PropellantKind::HYBRID;
    if (value == "solid") return PropellantKind::SOLID;
    badChoice("motor.kind", value, "hybrid, solid");
}

NozzleType parseNozzleType(const std::string& value) {
    if (value == "conical") return NozzleType::CONICAL;
    if (value == "bell") return NozzleType::BELL;
    if (value == "parabolic") return NozzleType::PARABOLIC;
    badChoice("nozzle.type", value, "conical, bell, parabolic");
}

OxidizerPhase parsePhase(const std::string& value) {
    if (value == "liquid") return OxidizerPhase::LIQUID;
    if (value == "gas") return OxidizerPhase::GAS;
    badChoice("oxidizer.phase", value, "liquid, gas");
}

CombustionMode parseMode(const std::string& value) {
    if (value == "infinite" || value == "infinite_area") return CombustionMode::INFINITE_AREA;
    if (value == "finite" || value == "finite_area") return CombustionMode::FINITE_AREA;
    badChoice("combustion.mode", value, "infinite, finite");
}

void readMotor(const YAML::Node& root, RawMotorConfiguration& raw) {
    const YAML::Node node = section(root, "motor");
    warnUnknownKeys(node, "motor", {"kind", "propellant", "thrust", "burn_time", "total_impulse", "of_ratio",
                                    "chamber_pressure", "atmospheric_pressure", "altitude", "chamber_temperature",
                                    "gamma", "gas_constant", "characteristic_length", "burn_rate_coefficient",
                                    "burn_rate_exponent", "propellant_density", "initial_temperature",
                                    "temperature_coefficient"});

    if (auto kind = readString(node, "motor", "kind")) raw.kind = parseKind(*kind);
    raw.propellant = readString(node, "motor", "propellant");
    raw.thrust = readDouble(node, "motor", "thrust");
    raw.burn_time = readDouble(node, "motor", "burn_time");
    raw.total_impulse = readDouble(node, "motor", "total_impulse");
    raw.of_ratio = readDouble(node, "motor", "of_ratio");
    raw.chamber_pressure = readDouble(node, "motor", "chamber_pressure");
    raw.atmospheric_pressure = readDouble(node, "motor", "atmospheric_pressure");
    raw.altitude = readDouble(node, "motor", "altitude");
    raw.chamber_temperature = readDouble(node, "motor", "chamber_temperature");
    raw.gamma = readDouble(node, "motor", "gamma");
    raw.gas_constant = readDouble(node, "motor", "gas_constant");
    raw.characteristic_length = readDouble(node, "motor", "characteristic_length");
    raw.burn_rate_coefficient = readDouble(node, "motor", "burn_rate_coefficient");
    raw.burn_rate_exponent = readDouble(node, "motor", "burn_rate_exponent");
    raw.propellant_density = readDouble(node, "motor", "propellant_density");
    raw.initial_temperature = readDouble(node, "motor", "initial_temperature");
    raw.temperature_coefficient = readDouble(node, "motor", "temperature_coefficient");
}

void readNozzle(const YAML::Node& root, RawMotorConfiguration& raw) {
    const YAML::Node node = section(root, "nozzle");
    warnUnknownKeys(node, "nozzle", {"type", "expansion_ratio", "efficiency"});

    if (auto type = readString(node, "nozzle", "type")) raw.nozzle_type = parseNozzleType(*type);
    raw.expansion_ratio = readDouble(node, "nozzle", "expansion_ratio");
    raw.nozzle_efficiency = readDouble(node, "nozzle", "efficiency");
}

void readOxidizer(const YAML::Node& root, RawMotorConfiguration& raw) {
    const YAML::Node node = section(root, "oxidizer");
    warnUnknownKeys(node, "oxidizer", {"phase", "density", "viscosity", "vapor_pressure"});

    if (auto phase = readString(node, "oxidizer", "phase")) raw.oxidizer_phase = parsePhase(*phase);
    raw.oxidizer_density = readDouble(node, "oxidizer", "density");
    raw.oxidizer_viscosity = readDouble(node, "oxidizer", "viscosity");
    raw.oxidizer_vapor_pressure = readDouble(node, "oxidizer", "vapor_pressure");
}

void readFeed(const YAML::Node& root, RawMotorConfiguration& raw) {
    const YAML::Node node = section(root, "feed");
    warnUnknownKeys(node, "feed", {"tank_pressure", "initial_oxidizer_flux"});

    raw.tank_pressure = readDouble(node, "feed", "tank_pressure");
    raw.initial_oxidizer_flux = readDouble(node, "feed", "initial_oxidizer_flux");
}

void readGrain(const YAML::Node& root, RawMotorConfiguration& raw) {
    const YAML::Node node = section(root, "grain");
    warnUnknownKeys(node, "grain", {"outer_diameter", "core_diameter", "segment_length", "segment_count",
                                    "burnthrough_margin"});

    raw.burnthrough_margin = readDouble(node, "grain", "burnthrough_margin");

    auto outer = readDouble(node, "grain", "outer_diameter");
    auto core = readDouble(node, "grain", "core_diameter");
    auto length = readDouble(node, "grain", "segment_length");
    auto count = readInt(node, "grain", "segment_count");
    if (outer || core || length || count) {
        if (!(outer && core && length)) {
            throw ConfigurationError("'grain' needs outer_diameter, core_diameter and segment_length together");
        }
        raw.grain = SolidGrain(*outer, *core, *length, count.value_or(1));
    }
}

void readCombustion(const YAML::Node& root, RawMotorConfiguration& raw) {
    const YAML::Node node = section(root, "combustion");
    warnUnknownKeys(node, "combustion", {"mode", "contraction_ratio", "chamber_mass_flux", "chamber_diameter"});

    if (auto mode = readString(node, "combustion", "mode")) raw.combustion_mode = parseMode(*mode);
    raw.contraction_ratio = readDouble(node, "combustion", "contraction_ratio");
    raw.chamber_mass_flux = readDouble(node, "combustion", "chamber_mass_flux");
    raw.chamber_diameter = readDouble(node, "combustion", "chamber_diameter");
}

void readInjector(const YAML::Node& root, RawMotorConfiguration& raw) {
    const YAML::Node node = section(root, "injector");
    if (!node) return;
    warnUnknownKeys(node, "injector", {"type", "discharge_coefficient", "pressure_drop", "target_velocity",
                                       "hole_count", "min_hole_diameter", "max_hole_diameter", "plate_thickness",
                                       "outer_diameter", "pintle_diameter", "slot_count", "spray_half_angle_deg"});

    const std::string type = readString(node, "injector", "type").value_or("showerhead");
    InjectorSpec spec;
    if (type == "showerhead") {
        ShowerheadParams params;
        params.target_velocity = readDouble(node, "injector", "target_velocity").value_or(params.target_velocity);
        params.hole_count = readInt(node, "injector", "hole_count").value_or(params.hole_count);
        params.min_hole_diameter = readDouble(node, "injector", "min_hole_diameter").value_or(params.min_hole_diameter);
        params.max_hole_diameter = readDouble(node, "injector", "max_hole_diameter").value_or(params.max_hole_diameter);
        params.plate_thickness = readDouble(node, "injector", "plate_thickness").value_or(params.plate_thickness);
        spec.params = params;
    } else if (type == "pintle") {
        PintleParams params;
        params.outer_diameter = readDouble(node, "injector", "outer_diameter").value_or(params.outer_diameter);
        params.pintle_diameter = readDouble(node, "injector", "pintle_diameter").value_or(params.pintle_diameter);
        spec.params = params;
    } else if (type == "swirl") {
        SwirlParams params;
        params.slot_count = readInt(node, "injector", "slot_count").value_or(params.slot_count);
        if (auto angle = readDouble(node, "injector", "spray_half_angle_deg")) {
            params.spray_half_angle = *angle * constants::kPi / 180.0;
        }
        spec.params = params;
    } else {
        badChoice("injector.type", type, "showerhead, pintle, swirl");
    }
    spec.discharge_coefficient = readDouble(node, "injector", "discharge_coefficient");
    spec.pressure_drop = readDouble(node, "injector", "pressure_drop");
    raw.injector = spec;
}

RawMotorConfiguration parseRoot(const YAML::Node& root) {
    if (!root.IsMap()) {
        throw ConfigurationError("configuration root must be a map");
    }
    static const std::set<std::string> kSections = {"motor", "nozzle", "oxidizer", "feed", "grain", "combustion",
                                                    "injector", "regression", "monte_carlo", "logging"};
    warnUnknownKeys(root, "root", kSections);

    RawMotorConfiguration raw;
    readMotor(root, raw);
    readNozzle(root, raw);
    readOxidizer(root, raw);
    readFeed(root, raw);
    readGrain(root, raw);
    readCombustion(root, raw);
    readInjector(root, raw);
    return raw;
}

AnalysisSettings parseAnalysis(const YAML::Node& root) {
    AnalysisSettings settings;
    const YAML::Node regression = section(root, "regression");
    warnUnknownKeys(regression, "regression", {"steps"});
    if (auto steps = readInt(regression, "regression", "steps")) {
        if (*steps <= 0) {
            throw ConfigurationError("'regression.steps' must be positive");
        }
        settings.regression_steps = static_cast<size_t>(*steps);
    }

    const YAML::Node logging = section(root, "logging");
    warnUnknownKeys(logging, "logging", {"level"});
    if (auto level = readString(logging, "logging", "level")) {
        settings.log_level = parseLogLevel(*level);
    }
    return settings;
}

MonteCarloSettings parseMonteCarlo(const YAML::Node& root) {
    const YAML::Node node = section(root, "monte_carlo");
    if (!node) {
        throw ConfigurationError("missing 'monte_carlo' section");
    }
    warnUnknownKeys(node, "monte_carlo", {"samples", "seed", "workers", "include_injector", "uncertainty"});

    MonteCarloSettings settings;
    if (auto samples = readInt(node, "monte_carlo", "samples")) {
        if (*samples <= 0) {
            throw ConfigurationError("'monte_carlo.samples' must be positive");
        }
        settings.samples = static_cast<size_t>(*samples);
    }
    if (auto seed = read<uint64_t>(node, "monte_carlo", "seed", "a non-negative integer")) {
        settings.options.seed = *seed;
    }
    if (auto workers = readInt(node, "monte_carlo", "workers")) {
        if (*workers < 0) {
            throw ConfigurationError("'monte_carlo.workers' must not be negative");
        }
        settings.options.worker_count = static_cast<size_t>(*workers);
    }
    if (auto include = read<bool>(node, "monte_carlo", "include_injector", "true or false")) {
        settings.options.include_injector = *include;
    }

    const YAML::Node uncertainty = node["uncertainty"];
    if (uncertainty) {
        if (!uncertainty.IsMap()) {
            throw ConfigurationError("'monte_carlo.uncertainty' must map parameter names to sigmas");
        }
        for (auto it = uncertainty.begin(); it != uncertainty.end(); ++it) {
            const std::string name = it->first.as<std::string>();
            auto sigma = readDouble(uncertainty, "monte_carlo.uncertainty", name);
            if (!sigma) {
                throw ConfigurationError(fmt::format("'monte_carlo.uncertainty.{}' needs a value", name));
            }
            settings.uncertainty[name] = *sigma;
        }
    }
    return settings;
}

} // namespace

RawMotorConfiguration loadConfiguration(const std::string& filename) {
    return parseRoot(loadFile(filename));
}

RawMotorConfiguration parseConfiguration(const std::string& yaml_text) {
    return parseRoot(loadText(yaml_text));
}

AnalysisSettings loadAnalysisSettings(const std::string& filename) {
    return parseAnalysis(loadFile(filename));
}

AnalysisSettings parseAnalysisSettings(const std::string& yaml_text) {
    return parseAnalysis(loadText(yaml_text));
}

MonteCarloSettings loadMonteCarloSettings(const std::string& filename) {
    return parseMonteCarlo(loadFile(filename));
}

MonteCarloSettings parseMonteCarloSettings(const std::string& yaml_text) {
    return parseMonteCarlo(loadText(yaml_text));
}

} // namespace utils
} // namespace motor_design
