#include "tuning/trace.h"

#include "tuning/errors.h"

#include <fstream>

using json = nlohmann::json;

namespace tuning {

void JsonTraceSink::beginOptimizer(std::string const& name) {
    current_ = name;
    current();
}

json& JsonTraceSink::current() {
    json& entry = root_[current_];
    if (entry.is_null()) {
        entry = {{"series", json::array()}, {"target", nullptr}, {"next", nullptr}};
    }
    return entry;
}

void JsonTraceSink::series(std::string const& label, std::vector<double> const& x,
                           std::vector<double> const& y) {
    current()["series"].push_back({{"label", label}, {"x", x}, {"y", y}});
}

void JsonTraceSink::targetLine(double y) {
    current()["target"] = y;
}

void JsonTraceSink::nextValueMarker(double x, double y) {
    current()["next"] = {{"x", x}, {"y", y}};
}

void JsonTraceSink::save(std::filesystem::path const& path) const {
    std::ofstream out(path);
    if (!out) {
        throw TuningError("Could not open trace file for writing: " + path.string());
    }
    out << root_.dump(2) << "\n";
}

} // namespace tuning
