#pragma once
#include "Cleaner.h"
#include "TypedDataset.h"
#include <iostream>
#include <string>

class TerminalUI {
public:
    static void printSummary(const TypedDataset& data, std::ostream& os = std::cout);
    // Text values are quoted so surrounding whitespace stays visible; missing cells print as <NA>.
    static void printPreview(const TypedDataset& data, size_t maxRows, std::ostream& os = std::cout);
    static void printIqrBounds(const std::string& columnName, const IqrBounds& bounds, std::ostream& os = std::cout);
};
