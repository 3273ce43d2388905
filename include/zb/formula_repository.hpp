#pragma once

#include <zb/formula.hpp>
#include <zb/result.hpp>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace zb {

// Read-only formula source used by the resolver
class FormulaLookup {
public:
    virtual ~FormulaLookup() = default;

    // Every known version of `name`, highest first; empty if unknown
    virtual std::vector<const Formula*> candidates(const std::string& name) const = 0;
};

// Parse a JSON document holding one formula object or an array of them.
// Accepts Homebrew's API shape and the short {version, bottles} shape.
Result<std::vector<Formula>> parse_formula_document(const std::string& text,
                                                    const std::string& origin = "<string>");

// In-memory set of formulas loaded from JSON. Several versions of one
// name may coexist.
class FormulaRepository : public FormulaLookup {
public:
    FormulaRepository() = default;
    FormulaRepository(const FormulaRepository&) = delete;
    FormulaRepository& operator=(const FormulaRepository&) = delete;
    FormulaRepository(FormulaRepository&&) = default;
    FormulaRepository& operator=(FormulaRepository&&) = default;

    // Every *.json file directly inside `dir`, in name order
    Status load_directory(const std::filesystem::path& dir);
    Status load_file(const std::filesystem::path& path);
    Status load_string(const std::string& json, const std::string& origin = "<string>");

    // Validates; adding the same name and version twice is an error
    Status add(Formula formula);

    std::vector<const Formula*> candidates(const std::string& name) const override;

    // Highest version of `name`, nullptr if unknown
    const Formula* find(const std::string& name) const;
    const Formula* find(const std::string& name, const Version& version) const;

    std::vector<std::string> names() const;
    size_t size() const;

private:
    std::map<std::string, std::vector<std::unique_ptr<Formula>>> formulas_;
};

} // namespace zb
