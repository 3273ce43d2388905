#include <zb/formula_repository.hpp>
#include <zb/log.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace zb {

static ZbError doc_error(const std::string& origin, const std::string& msg) {
    return ZbError{ZbError::Parse, origin + ": " + msg};
}

static std::string string_field(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

static Result<Dependency> parse_dependency_entry(const json& entry, const std::string& origin) {
    if (entry.is_string()) {
        auto dep = Dependency::parse(entry.get<std::string>());
        if (dep.is_err()) return doc_error(origin, dep.error().message);
        return dep;
    }
    if (entry.is_object()) {
        std::string name = string_field(entry, "name");
        std::string constraint = string_field(entry, "version");
        if (name.empty()) {
            return doc_error(origin, "dependency object without a name");
        }
        auto dep = Dependency::parse(constraint.empty() ? name : name + " " + constraint);
        if (dep.is_err()) return doc_error(origin, dep.error().message);
        return dep;
    }
    return doc_error(origin, "dependency must be a string or an object");
}

static Result<BottleSpec> parse_bottle_entry(const std::string& tag, const json& entry,
                                             const std::string& origin) {
    if (!entry.is_object()) {
        return doc_error(origin, "bottle '" + tag + "' must be an object");
    }
    auto platform = Platform::parse(tag);
    if (platform.is_err()) {
        return doc_error(origin, platform.error().message);
    }

    BottleSpec spec;
    spec.platform = std::move(platform).value();
    spec.url = string_field(entry, "url");
    spec.sha256 = string_field(entry, "sha256");

    auto size = entry.find("size");
    if (size != entry.end()) {
        if (!size->is_number_unsigned()) {
            return doc_error(origin, "bottle '" + tag + "' size must be a non-negative integer");
        }
        spec.size = size->get<uint64_t>();
    }
    return Result<BottleSpec>::ok(std::move(spec));
}

static Result<Formula> parse_formula_object(const json& obj, const std::string& origin) {
    if (!obj.is_object()) {
        return doc_error(origin, "formula must be a JSON object");
    }

    Formula f;

    std::string raw_name = string_field(obj, "name");
    if (raw_name.empty()) raw_name = string_field(obj, "full_name");
    if (raw_name.empty()) {
        return doc_error(origin, "formula without a name");
    }
    auto name = normalize_formula_name(raw_name);
    if (name.is_err()) return std::move(name).error();
    f.name = std::move(name).value();

    const std::string where = origin + " (" + f.name + ")";

    // Version: versions.stable or version
    std::string version_text;
    auto versions = obj.find("versions");
    if (versions != obj.end() && versions->is_object()) {
        version_text = string_field(*versions, "stable");
    }
    if (version_text.empty()) version_text = string_field(obj, "version");
    if (version_text.empty()) {
        return doc_error(where, "formula has no version");
    }
    auto version = Version::parse(version_text);
    if (version.is_err()) return doc_error(where, version.error().message);
    f.version = std::move(version).value();

    auto revision = obj.find("revision");
    if (revision != obj.end() && !revision->is_null()) {
        if (!revision->is_number_integer() || revision->get<int>() < 0) {
            return doc_error(where, "revision must be a non-negative integer");
        }
        if (revision->get<int>() > 0) f.version.revision = revision->get<int>();
    }

    f.desc = string_field(obj, "desc");
    f.homepage = string_field(obj, "homepage");

    auto deps = obj.find("dependencies");
    if (deps != obj.end() && !deps->is_null()) {
        if (!deps->is_array()) {
            return doc_error(where, "dependencies must be an array");
        }
        for (auto& entry : *deps) {
            auto dep = parse_dependency_entry(entry, where);
            if (dep.is_err()) return std::move(dep).error();
            f.dependencies.push_back(std::move(dep).value());
        }
    }

    // Bottles: bottle.stable.files or bottles
    const json* files = nullptr;
    auto bottle = obj.find("bottle");
    if (bottle != obj.end() && bottle->is_object()) {
        auto stable = bottle->find("stable");
        if (stable != bottle->end() && stable->is_object()) {
            auto f_it = stable->find("files");
            if (f_it != stable->end()) files = &*f_it;
        }
    }
    auto bottles = obj.find("bottles");
    if (!files && bottles != obj.end()) files = &*bottles;

    if (files) {
        if (!files->is_object()) {
            return doc_error(where, "bottle files must be an object");
        }
        for (auto& [tag, entry] : files->items()) {
            auto spec = parse_bottle_entry(tag, entry, where);
            if (spec.is_err()) return std::move(spec).error();
            std::string key = spec.value().platform_tag();
            if (f.bottles.count(key)) {
                return doc_error(where, "duplicate bottle for platform '" + key + "'");
            }
            f.bottles.emplace(key, std::move(spec).value());
        }
    }

    auto valid = f.validate();
    if (valid.is_err()) return doc_error(origin, valid.error().message);

    return Result<Formula>::ok(std::move(f));
}

Result<std::vector<Formula>> parse_formula_document(const std::string& text,
                                                    const std::string& origin) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return ZbError{ZbError::Parse, origin + ": invalid JSON: " + e.what()};
    }

    std::vector<Formula> out;
    try {
        if (doc.is_array()) {
            for (auto& item : doc) {
                auto f = parse_formula_object(item, origin);
                if (f.is_err()) return std::move(f).error();
                out.push_back(std::move(f).value());
            }
        } else {
            auto f = parse_formula_object(doc, origin);
            if (f.is_err()) return std::move(f).error();
            out.push_back(std::move(f).value());
        }
    } catch (const json::exception& e) {
        return ZbError{ZbError::Parse, origin + ": " + e.what()};
    }
    return Result<std::vector<Formula>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// FormulaRepository
// ---------------------------------------------------------------------------

Status FormulaRepository::load_directory(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return ZbError{ZbError::NotFound,
            "formula directory not found: " + dir.string(),
            "set 'formulas' in config.toml or pass --formulas"};
    }

    std::vector<fs::path> files;
    for (auto& entry : fs::directory_iterator(dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        return ZbError{ZbError::IO, "cannot read formula directory " + dir.string() +
            ": " + ec.message()};
    }

    std::sort(files.begin(), files.end());
    for (auto& file : files) {
        ZB_TRY(load_file(file));
    }
    log::debug("loaded %zu formula(s) from %s", size(), dir.c_str());
    return ok_status();
}

Status FormulaRepository::load_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return ZbError{ZbError::IO, "cannot open formula file: " + path.string()};
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return load_string(ss.str(), path.string());
}

Status FormulaRepository::load_string(const std::string& text, const std::string& origin) {
    auto parsed = parse_formula_document(text, origin);
    if (parsed.is_err()) return std::move(parsed).error();
    for (auto& f : parsed.value()) {
        ZB_TRY(add(std::move(f)));
    }
    return ok_status();
}

Status FormulaRepository::add(Formula formula) {
    ZB_TRY(formula.validate());

    auto& versions = formulas_[formula.name];
    for (auto& existing : versions) {
        if (existing->version == formula.version) {
            return ZbError{ZbError::Parse,
                "formula " + formula.id() + " is defined twice"};
        }
    }

    versions.push_back(std::make_unique<Formula>(std::move(formula)));
    std::sort(versions.begin(), versions.end(),
        [](const std::unique_ptr<Formula>& a, const std::unique_ptr<Formula>& b) {
            return a->version > b->version;
        });
    return ok_status();
}

std::vector<const Formula*> FormulaRepository::candidates(const std::string& name) const {
    std::vector<const Formula*> out;
    auto it = formulas_.find(name);
    if (it == formulas_.end()) return out;
    for (auto& f : it->second) out.push_back(f.get());
    return out;
}

const Formula* FormulaRepository::find(const std::string& name) const {
    auto it = formulas_.find(name);
    if (it == formulas_.end() || it->second.empty()) return nullptr;
    return it->second.front().get();
}

const Formula* FormulaRepository::find(const std::string& name, const Version& version) const {
    auto it = formulas_.find(name);
    if (it == formulas_.end()) return nullptr;
    for (auto& f : it->second) {
        if (f->version == version) return f.get();
    }
    return nullptr;
}

std::vector<std::string> FormulaRepository::names() const {
    std::vector<std::string> out;
    for (auto& [name, versions] : formulas_) out.push_back(name);
    return out;
}

size_t FormulaRepository::size() const {
    size_t n = 0;
    for (auto& [name, versions] : formulas_) n += versions.size();
    return n;
}

} // namespace zb
