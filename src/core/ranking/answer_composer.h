#pragma once

#include "core/ranking/coverage_estimator.h"

#include <QString>

#include <vector>

namespace sl {

struct ComposedAnswer {
    QString text;
    std::vector<EvidenceHit> sources;
    bool abstained = true;
};

// Builds the short extractive reply: either an abstention or a listing of
// the top sources as "title - section".
class AnswerComposer {
public:
    static constexpr int kMaxSources = 3;

    static ComposedAnswer compose(const Estimate& estimate, int maxSources = kMaxSources);

    static QString abstainText();
};

} // namespace sl
