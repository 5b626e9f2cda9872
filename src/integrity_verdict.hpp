#ifndef INTEGRITY_VERDICT_HPP
#define INTEGRITY_VERDICT_HPP

#include "analysis_types.hpp"

namespace formcheck {

class IntegrityVerdictComposer {
public:
    IntegrityVerdict compose(const SimilarityReport& duplication,
                             const MotionReport& motion,
                             int frames_analyzed) const;

    // Returned instead of an error whenever the integrity check cannot run
    static IntegrityVerdict failOpenVerdict();
};

} // namespace formcheck

#endif // INTEGRITY_VERDICT_HPP
