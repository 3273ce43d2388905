#include <zb/bottle_selector.hpp>
#include <zb/log.hpp>

namespace zb {

Result<BottleSpec> select_bottle(const Formula& formula, const Platform& host) {
    auto chain = compatibility_chain(host);

    for (size_t i = 0; i < chain.size(); ++i) {
        auto it = formula.bottles.find(chain[i].to_string());
        if (it == formula.bottles.end()) continue;

        if (i > 0) {
            log::debug("%s: no %s bottle, using %s", formula.id().c_str(),
                       host.to_string().c_str(), it->first.c_str());
        }
        return Result<BottleSpec>::ok(it->second);
    }

    std::string offered;
    for (auto& [tag, spec] : formula.bottles) {
        if (!offered.empty()) offered += ", ";
        offered += tag;
    }
    if (offered.empty()) offered = "none";

    return ZbError{ZbError::NoCompatibleBottle,
        "no bottle of " + formula.id() + " runs on " + host.to_string() +
        " (offered: " + offered + ")",
        "building from source is not supported"};
}

} // namespace zb
