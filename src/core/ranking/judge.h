#pragma once

#include "core/shared/evidence.h"

#include <QString>

#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

namespace sl {

// A way of scoring (query, candidate) relevance into [0,1].
class JudgeStrategy {
public:
    virtual ~JudgeStrategy() = default;

    // "real", "proxy" or "off"; echoed in response metadata.
    virtual QString name() const = 0;
    virtual bool isAvailable() const = 0;

    // One score per candidate, in input order. nullopt signals failure and
    // lets the caller fall through to the next strategy.
    virtual std::optional<std::vector<double>> score(const QString& query,
                                                     const std::vector<Candidate>& candidates,
                                                     QString* errorOut = nullptr) = 0;

    // Number of model invocations made so far.
    virtual int64_t invocations() const { return 0; }
};

// Blend of retrieval signals: max(f, ws * s + wl * l), clamped to [0,1].
class ProxyJudge : public JudgeStrategy {
public:
    ProxyJudge(double semanticWeight = 0.6, double lexicalWeight = 0.4);

    QString name() const override { return QStringLiteral("proxy"); }
    bool isAvailable() const override { return true; }
    std::optional<std::vector<double>> score(const QString& query,
                                             const std::vector<Candidate>& candidates,
                                             QString* errorOut = nullptr) override;

    double scoreOne(const Candidate& candidate) const;

private:
    double m_semanticWeight;
    double m_lexicalWeight;
};

// No judging: the normalized fused score passes through unchanged.
class OffJudge : public JudgeStrategy {
public:
    QString name() const override { return QStringLiteral("off"); }
    bool isAvailable() const override { return true; }
    std::optional<std::vector<double>> score(const QString& query,
                                             const std::vector<Candidate>& candidates,
                                             QString* errorOut = nullptr) override;
};

} // namespace sl
