// SPECTER - ani_reconciler.h
// Directional ANI/AF measurements and their symmetric reconciliation

#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>

namespace specter {

struct AniAf {
    double ani = 0.0;
    double af = 0.0;

    bool operator==(const AniAf& o) const { return ani == o.ani && af == o.af; }
};

// ANI/AF from query genome to reference genome, keyed by ordered pair
class AniAfMatrix {
public:
    void set(const std::string& query, const std::string& ref, double ani, double af);

    std::optional<AniAf> get(const std::string& query, const std::string& ref) const;
    bool contains(const std::string& query, const std::string& ref) const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    // All genome ids seen as query or reference
    std::set<std::string> genome_ids() const;

    auto begin() const { return values_.begin(); }
    auto end() const { return values_.end(); }

private:
    std::map<std::pair<std::string, std::string>, AniAf> values_;
};

// Symmetric ANI/AF: the larger value of each direction, maximized
// independently for ANI and AF. (0, 0) if either direction is missing.
AniAf symmetric_ani(const AniAfMatrix& m, const std::string& gid1, const std::string& gid2);

}  // namespace specter
