#pragma once

#include <map>
#include <string>

namespace tuning {

// One generate -> simulate -> analyze cycle
struct Batch {
    int batch_no = 0;
    std::string artifact_name;  // Without file extension
    std::string artifact_path;  // Folder holding the simulation input
    std::string output_path;    // Folder the solver writes its output to
    double variable_value = 0.0;
};

// Batch number -> Batch, dense from 1.
// Batch N+1 can only be added once batch N exists.
class BatchLedger {
public:
    BatchLedger() = default;
    explicit BatchLedger(Batch first);

    // Throws LedgerError unless batch.batch_no == size() + 1
    void add(Batch batch);

    // Throws LedgerError if the batch was never added
    Batch const& at(int batch_no) const;

    bool contains(int batch_no) const { return batches_.count(batch_no) != 0; }
    int size() const { return static_cast<int>(batches_.size()); }
    bool empty() const { return batches_.empty(); }

    // Highest batch number, 0 when empty
    int lastBatchNo() const { return batches_.empty() ? 0 : batches_.rbegin()->first; }

    std::map<int, Batch> const& batches() const { return batches_; }

    // Naming for generated batches: batch_{N}__{optimizer}_{variable}_{value}
    static std::string artifactName(int batch_no, std::string const& optimizer,
                                    std::string const& variable, double value);
    static std::string artifactFolder(int batch_no, std::string const& work_directory = "");
    static std::string outputFolder(int batch_no, std::string const& work_directory = "");

private:
    std::map<int, Batch> batches_;
};

} // namespace tuning
