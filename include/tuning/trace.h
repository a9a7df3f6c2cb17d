#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace tuning {

// Receiver for the visual trace of an optimizer and its strategy.
// x is always the variable parameter, y the measured output.
class TraceSink {
public:
    virtual ~TraceSink() = default;

    // A named polyline (fits) or scatter (history) series
    virtual void series(std::string const& label, std::vector<double> const& x,
                        std::vector<double> const& y) = 0;

    // Horizontal line at the target output value
    virtual void targetLine(double y) = 0;

    // Marker for the value the next batch will be generated with
    virtual void nextValueMarker(double x, double y) = 0;
};

// Collects trace output as JSON, one object per optimizer
class JsonTraceSink : public TraceSink {
public:
    // Subsequent calls are recorded under this optimizer name
    void beginOptimizer(std::string const& name);

    void series(std::string const& label, std::vector<double> const& x,
                std::vector<double> const& y) override;
    void targetLine(double y) override;
    void nextValueMarker(double x, double y) override;

    nlohmann::json const& toJSON() const { return root_; }

    // Throws TuningError if the file cannot be written
    void save(std::filesystem::path const& path) const;

private:
    nlohmann::json root_ = nlohmann::json::object();
    std::string current_ = "default";

    nlohmann::json& current();
};

} // namespace tuning
