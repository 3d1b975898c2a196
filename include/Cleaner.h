#pragma once
#include "TypedDataset.h"
#include <string>
#include <vector>

struct IqrBounds {
    double q1 = 0.0;
    double q3 = 0.0;
    double iqr = 0.0;
    double lower = 0.0;
    double upper = 0.0;
    size_t observed = 0;

    // False when the column had no finite value to fence.
    bool valid() const noexcept { return observed > 0; }
    bool contains(double v) const noexcept { return v >= lower && v <= upper; }
};

/**
 * @brief Stateless cleaning operations over TypedDataset.
 * @details Every operation validates all of its inputs before touching a row
 * and returns a new dataset; the argument is never modified.
 */
class Cleaner {
public:
    static constexpr double kDefaultIqrFactor = 1.5;

    /**
     * @brief Strips leading and trailing whitespace from every value of the named text columns.
     * @post Missing cells, unnamed columns and row identifiers are unchanged.
     * @throws Scrub::MissingColumnException when a name is absent (all names checked first).
     * @throws Scrub::WrongColumnTypeException when a named column is not text.
     */
    static TypedDataset trim(const TypedDataset& data, const std::vector<std::string>& columnNames);

    /**
     * @brief Removes rows holding a missing cell in any of the named columns.
     * @post Surviving rows keep identifiers and relative order; may yield zero rows.
     * @throws Scrub::MissingColumnException when a name is absent.
     */
    static TypedDataset dropInvalidRows(const TypedDataset& data, const std::vector<std::string>& columnNames);

    /**
     * @brief Removes rows whose value in columnName lies strictly outside the Tukey fence.
     * @details Fence is [Q1 - factor*IQR, Q3 + factor*IQR] over finite observed values,
     * quartiles by linear interpolation. Missing and NaN cells are always kept.
     * @throws Scrub::MissingColumnException, Scrub::WrongColumnTypeException,
     * Scrub::InvalidArgumentException (negative or non-finite factor).
     */
    static TypedDataset removeOutliersIQR(const TypedDataset& data,
                                          const std::string& columnName,
                                          double factor = kDefaultIqrFactor);

    /**
     * @brief Computes the fence removeOutliersIQR would apply, with the same validation.
     */
    static IqrBounds computeIqrBounds(const TypedDataset& data,
                                      const std::string& columnName,
                                      double factor = kDefaultIqrFactor);
};
