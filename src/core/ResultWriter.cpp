// src/core/ResultWriter.cpp
//
// JSON serialisation and file output for optimisation results.
//
// Documents are assembled with std::ostringstream. Doubles are printed with 17
// significant digits so gains round-trip exactly; non-finite values become
// `null`.
#include "ResultWriter.hpp"
#include <cmath>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace {

std::string number(double v) {
    if (!std::isfinite(v)) return "null";
    std::ostringstream oss;
    oss << std::setprecision(17) << v;
    return oss.str();
}

std::string quoted(const std::string& s) {
    std::ostringstream oss;
    oss << '"';
    for (char c : s) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec << std::setfill(' ');
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
    return oss.str();
}

std::string array(const std::vector<double>& values) {
    std::ostringstream oss;
    oss << '[';
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << number(values[i]);
    }
    oss << ']';
    return oss.str();
}

void writeResultBody(std::ostringstream& json, const OptimizationResult& r, const std::string& indent) {
    const FitnessBreakdown& b = r.best_breakdown;
    json << indent << "\"controller_type\": " << quoted(toString(r.controller)) << ",\n";
    json << indent << "\"best_gains\": " << array(r.best_gains) << ",\n";
    json << indent << "\"best_fitness\": " << number(r.best_fitness) << ",\n";
    json << indent << "\"metrics\": {\n";
    json << indent << "  \"chattering_index\": " << number(b.chattering_index) << ",\n";
    json << indent << "  \"tracking_error_rms\": " << number(b.tracking_rms) << ",\n";
    json << indent << "  \"tracking_penalty\": " << number(b.penalty) << ",\n";
    json << indent << "  \"control_effort_rms\": " << number(b.control_effort_rms) << ",\n";
    json << indent << "  \"total_variation\": " << number(b.total_variation) << ",\n";
    json << indent << "  \"smoothness_index\": " << number(b.smoothness_index) << "\n";
    json << indent << "},\n";
    json << indent << "\"acceptance_criteria\": {\n";
    json << indent << "  \"chattering_index\": " << (r.acceptance.chattering ? "true" : "false") << ",\n";
    json << indent << "  \"tracking_error\": " << (r.acceptance.tracking ? "true" : "false") << ",\n";
    json << indent << "  \"control_smoothness\": " << (r.acceptance.smoothness ? "true" : "false") << "\n";
    json << indent << "},\n";
    json << indent << "\"criteria_passed\": " << r.acceptance.passed() << ",\n";
    json << indent << "\"cost_history\": " << array(r.cost_history) << ",\n";
    json << indent << "\"iterations\": " << r.iterations << ",\n";
    json << indent << "\"evaluations\": " << r.evaluations << ",\n";
    json << indent << "\"failed_evaluations\": " << r.failed_evaluations << ",\n";
    json << indent << "\"optimization_time_seconds\": " << number(r.time_taken) << ",\n";
    json << indent << "\"evaluation_strategy\": " << quoted(r.strategy) << ",\n";
    json << indent << "\"warnings\": [";
    for (size_t i = 0; i < r.warnings.size(); ++i) {
        json << (i > 0 ? ", " : "") << quoted(r.warnings[i]);
    }
    json << "]\n";
}

void writeFile(const std::filesystem::path& path, const std::string& content) {
    checkOutputPath(path);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("cannot create directory " + path.parent_path().string() +
                                     ": " + ec.message());
        }
    }
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("cannot open " + path.string() + " for writing");
    out << content;
    out.flush();
    if (!out) throw std::runtime_error("failed writing " + path.string());
}

} // namespace

std::filesystem::path resultPathFor(const std::filesystem::path& dir, ControllerType controller) {
    return dir / ("gains_" + toString(controller) + "_chattering.json");
}

void checkOutputPath(const std::filesystem::path& path) {
    const std::filesystem::path name = path.filename();
    if (name.empty()) {
        throw std::runtime_error("output path has no file name: " + path.string());
    }
    if (path.parent_path().filename() == name) {
        throw DegeneratePathError(path.string());
    }
}

std::string toJson(const OptimizationResult& result) {
    std::ostringstream json;
    json << "{\n";
    writeResultBody(json, result, "  ");
    json << "}\n";
    return json.str();
}

void saveResult(const std::filesystem::path& path, const OptimizationResult& result) {
    writeFile(path, toJson(result));
}

void saveSummary(const std::filesystem::path& path, const std::vector<OptimizationResult>& results,
                 const SwarmConfig& swarm_cfg) {
    std::ostringstream json;
    json << "{\n";
    json << "  \"campaign_config\": {\n";
    json << "    \"n_particles\": " << swarm_cfg.n_particles << ",\n";
    json << "    \"iters\": " << swarm_cfg.iterations << ",\n";
    json << "    \"w\": " << number(swarm_cfg.w) << ",\n";
    json << "    \"c1\": " << number(swarm_cfg.c1) << ",\n";
    json << "    \"c2\": " << number(swarm_cfg.c2) << ",\n";
    json << "    \"seed\": " << swarm_cfg.seed << ",\n";
    json << "    \"controllers_optimized\": [";
    for (size_t i = 0; i < results.size(); ++i) {
        json << (i > 0 ? ", " : "") << quoted(toString(results[i].controller));
    }
    json << "]\n";
    json << "  },\n";
    json << "  \"results\": [\n";
    for (size_t i = 0; i < results.size(); ++i) {
        json << "    {\n";
        writeResultBody(json, results[i], "      ");
        json << "    }" << (i + 1 < results.size() ? "," : "") << "\n";
    }
    json << "  ]\n";
    json << "}\n";
    writeFile(path, json.str());
}
