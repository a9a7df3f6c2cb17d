#include "tuning/batch_ledger.h"

#include "tuning/errors.h"

#include <filesystem>
#include <sstream>
#include <utility>

namespace tuning {

namespace {

std::string joinFolder(std::string const& work_directory, std::string const& folder) {
    if (work_directory.empty()) {
        return folder;
    }
    return (std::filesystem::path(work_directory) / folder).string();
}

} // namespace

BatchLedger::BatchLedger(Batch first) {
    add(std::move(first));
}

void BatchLedger::add(Batch batch) {
    int expected = size() + 1;
    if (batch.batch_no != expected) {
        throw LedgerError("Cannot add batch " + std::to_string(batch.batch_no) +
                          " to ledger, expected batch " + std::to_string(expected));
    }
    batches_.emplace(batch.batch_no, std::move(batch));
}

Batch const& BatchLedger::at(int batch_no) const {
    auto it = batches_.find(batch_no);
    if (it == batches_.end()) {
        throw LedgerError("No batch files registered for batch number " + std::to_string(batch_no));
    }
    return it->second;
}

std::string BatchLedger::artifactName(int batch_no, std::string const& optimizer,
                                      std::string const& variable, double value) {
    std::ostringstream name;
    name << "batch_" << batch_no << "__" << optimizer << "_" << variable << "_" << value;
    return name.str();
}

std::string BatchLedger::artifactFolder(int batch_no, std::string const& work_directory) {
    return joinFolder(work_directory, "batch_" + std::to_string(batch_no) + "_son_files");
}

std::string BatchLedger::outputFolder(int batch_no, std::string const& work_directory) {
    return joinFolder(work_directory, "batch_" + std::to_string(batch_no) + "_outputs");
}

} // namespace tuning
