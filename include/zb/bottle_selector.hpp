#pragma once

#include <zb/formula.hpp>
#include <zb/platform.hpp>
#include <zb/result.hpp>

namespace zb {

// Best bottle of `formula` for `host`: exact tag, then older macOS releases
// of the same arch (newest first), then the release-less tag, then "all".
Result<BottleSpec> select_bottle(const Formula& formula, const Platform& host);

class BottleSelector {
public:
    explicit BottleSelector(Platform host) : host_(std::move(host)) {}

    Result<BottleSpec> select(const Formula& formula) const {
        return select_bottle(formula, host_);
    }

    const Platform& host() const { return host_; }

private:
    Platform host_;
};

} // namespace zb
