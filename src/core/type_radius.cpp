// SPECTER - type_radius.cpp

#include "type_radius.h"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace specter {

TypeRadiusMap compute_type_radius(const std::vector<std::string>& rep_ids,
                                  const AniAfMatrix& ani_af,
                                  int threads) {
    const int n = static_cast<int>(rep_ids.size());
    std::vector<TypeRadius> radius(n);
    if (threads < 1) threads = 1;

    #pragma omp parallel for num_threads(threads) schedule(dynamic, 16)
    for (int i = 0; i < n; i++) {
        TypeRadius& r = radius[i];
        for (int j = 0; j < n; j++) {
            if (i == j) continue;
            AniAf s = symmetric_ani(ani_af, rep_ids[i], rep_ids[j]);
            if (s.ani <= 0.0) continue;

            bool closer = !r.neighbour_gid || s.ani > r.ani
                || (s.ani == r.ani && rep_ids[j] < *r.neighbour_gid);
            if (closer) {
                r.ani = s.ani;
                r.af = s.af;
                r.neighbour_gid = rep_ids[j];
            }
        }
    }

    TypeRadiusMap out;
    for (int i = 0; i < n; i++) out[rep_ids[i]] = radius[i];
    return out;
}

}  // namespace specter
