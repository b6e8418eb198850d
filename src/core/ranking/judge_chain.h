#pragma once

#include "core/ranking/judge.h"
#include "core/shared/task_pool.h"

#include <QJsonObject>

#include <memory>
#include <vector>

namespace sl {

// How a judging request was actually served.
struct JudgeReport {
    JudgeMode requested = JudgeMode::Proxy;
    QString servedBy;
    bool degraded = false;       // served by something other than requested
    bool timedOut = false;       // model exceeded its budget
    QString fallbackReason;
    int judged = 0;
    int64_t invocations = 0;
    QStringList attempted;

    QJsonObject toJson() const;
};

struct JudgeResult {
    std::vector<double> scores;  // one per candidate, in input order
    JudgeReport report;
};

// Tries judge strategies in order for the requested mode:
//   real  -> [real, proxy]
//   proxy -> [proxy]
//   off   -> [off]
// The real judge runs on a bounded worker pool with a per-call budget. A
// full queue counts as unavailable; an exceeded budget stops the chain
// with off semantics.
class JudgeChain {
public:
    struct Options {
        int workers = 1;
        int queueLimit = 8;
        int budgetMs = 1500;
    };

    JudgeChain(std::shared_ptr<JudgeStrategy> real, std::shared_ptr<JudgeStrategy> proxy,
               std::shared_ptr<JudgeStrategy> off, Options options);
    ~JudgeChain();

    JudgeResult judge(const QString& query, const std::vector<Candidate>& candidates,
                      JudgeMode requested);

    std::vector<std::shared_ptr<JudgeStrategy>> chainFor(JudgeMode requested) const;
    bool realAvailable() const;

    QJsonObject status() const;

private:
    enum class Attempt { Served, Unavailable, Failed, TimedOut };

    Attempt runPooled(const std::shared_ptr<JudgeStrategy>& strategy, const QString& query,
                      const std::vector<Candidate>& candidates, std::vector<double>* scoresOut,
                      QString* reasonOut);

    std::shared_ptr<JudgeStrategy> m_real;
    std::shared_ptr<JudgeStrategy> m_proxy;
    std::shared_ptr<JudgeStrategy> m_off;
    Options m_options;
    std::unique_ptr<TaskPool> m_pool;
};

} // namespace sl
