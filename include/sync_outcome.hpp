#pragma once

#include <string>
#include <vector>

/**
 * Pipeline stage an error happened in.
 */
enum class SyncStage
{
    Listing,
    Mapping,
    Download,
    Delete
};

const char *toString(SyncStage stage);

/**
 * One recorded error. webPath is empty for run level errors.
 */
struct SyncFailure
{
    SyncStage stage;
    std::string webPath;
    std::string message;
};

/**
 * Outcome of one run: the files downloaded and the errors met, in the order
 * they happened. Filled by the pipeline, read once by the reporter.
 */
class SyncOutcome
{
public:
    void addFile(std::string name) { downloaded_.push_back(std::move(name)); }
    void addError(SyncFailure failure) { errors_.push_back(std::move(failure)); }

    const std::vector<std::string> &files() const { return downloaded_; }
    const std::vector<SyncFailure> &errors() const { return errors_; }

    // Nothing to report
    bool empty() const { return downloaded_.empty() && errors_.empty(); }

private:
    std::vector<std::string> downloaded_;
    std::vector<SyncFailure> errors_;
};
