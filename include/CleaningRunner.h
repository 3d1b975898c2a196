#pragma once
#include "CleanConfig.h"
#include "Cleaner.h"
#include "TypedDataset.h"
#include <iostream>
#include <optional>
#include <string>

struct CleaningReport {
    std::string operation;
    size_t rowsBefore = 0;
    size_t rowsAfter = 0;
    std::optional<IqrBounds> bounds;
    std::string exportedPath;

    size_t rowsRemoved() const noexcept { return rowsBefore - rowsAfter; }
};

class CleaningRunner {
public:
    explicit CleaningRunner(CleanConfig config);

    /**
     * @brief Applies the configured operation to an already loaded dataset.
     * @throws Scrub::ConfigurationException when the config does not validate.
     * @throws Scrub::MissingColumnException / Scrub::WrongColumnTypeException from the Cleaner.
     */
    TypedDataset apply(const TypedDataset& data, CleaningReport& report) const;

    /**
     * @brief Loads the dataset, applies the single configured operation, previews and exports it.
     * @throws Scrub::ScrubException subclasses on any failure; nothing is written on failure.
     */
    CleaningReport run(std::ostream& log = std::cout) const;

private:
    CleanConfig config_;
};
