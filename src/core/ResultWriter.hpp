// src/core/ResultWriter.hpp
//
// Persistence of optimisation results for the **ChatteringOptimizationEngine**.
//
// Results are written as JSON documents. The output path handed to
// `saveResult` is used verbatim: it is never re-joined with its own file
// name. Paths whose last two components are the same name (`gains.json/gains.json`)
// are rejected with `DegeneratePathError`.
#ifndef RESULT_WRITER_HPP
#define RESULT_WRITER_HPP
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include "Engine.hpp"

/**
 * @brief Output path ends in a self-joined `<name>/<name>` pair.
 */
class DegeneratePathError : public std::runtime_error {
public:
    explicit DegeneratePathError(const std::string& path)
        : std::runtime_error("degenerate output path (file name joined with itself): " + path) {}
};

/**
 * @brief Per-controller result file inside an output directory.
 *
 * @return dir / "gains_<controller>_chattering.json"
 */
std::filesystem::path resultPathFor(const std::filesystem::path& dir, ControllerType controller);

/**
 * @brief Rejects `<...>/<name>/<name>` paths.
 *
 * @throws DegeneratePathError when the file name equals its parent's name.
 */
void checkOutputPath(const std::filesystem::path& path);

/**
 * @brief JSON document of a single result.
 */
std::string toJson(const OptimizationResult& result);

/**
 * @brief Writes a result to exactly `path`, creating missing parent directories.
 *
 * @throws DegeneratePathError for a self-joined path.
 * @throws std::runtime_error when the file cannot be written.
 */
void saveResult(const std::filesystem::path& path, const OptimizationResult& result);

/**
 * @brief Writes a campaign summary (swarm settings and every result) to `path`.
 *
 * Same path rules and errors as saveResult().
 */
void saveSummary(const std::filesystem::path& path, const std::vector<OptimizationResult>& results,
                 const SwarmConfig& swarm_cfg);

#endif // RESULT_WRITER_HPP
