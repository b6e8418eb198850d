#include "core/ranking/judge_chain.h"

#include "core/shared/logging.h"

#include <QJsonArray>

#include <chrono>

namespace sl {

QJsonObject JudgeReport::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("requested")] = judgeModeToString(requested);
    json[QStringLiteral("served_by")] = servedBy;
    json[QStringLiteral("degraded")] = degraded;
    json[QStringLiteral("timed_out")] = timedOut;
    json[QStringLiteral("fallback_reason")] =
        fallbackReason.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(fallbackReason);
    json[QStringLiteral("judged")] = judged;
    json[QStringLiteral("invocations")] = static_cast<qint64>(invocations);
    json[QStringLiteral("attempted")] = QJsonArray::fromStringList(attempted);
    return json;
}

JudgeChain::JudgeChain(std::shared_ptr<JudgeStrategy> real, std::shared_ptr<JudgeStrategy> proxy,
                       std::shared_ptr<JudgeStrategy> off, Options options)
    : m_real(std::move(real))
    , m_proxy(std::move(proxy))
    , m_off(std::move(off))
    , m_options(options)
    , m_pool(std::make_unique<TaskPool>(QStringLiteral("judge"), options.workers, options.queueLimit))
{
}

JudgeChain::~JudgeChain()
{
    m_pool->stop();
}

std::vector<std::shared_ptr<JudgeStrategy>> JudgeChain::chainFor(JudgeMode requested) const
{
    switch (requested) {
    case JudgeMode::Real:  return {m_real, m_proxy};
    case JudgeMode::Proxy: return {m_proxy};
    case JudgeMode::Off:   return {m_off};
    }
    return {m_proxy};
}

bool JudgeChain::realAvailable() const
{
    return m_real && m_real->isAvailable();
}

JudgeChain::Attempt JudgeChain::runPooled(const std::shared_ptr<JudgeStrategy>& strategy,
                                          const QString& query,
                                          const std::vector<Candidate>& candidates,
                                          std::vector<double>* scoresOut, QString* reasonOut)
{
    using Outcome = std::pair<std::optional<std::vector<double>>, QString>;
    const auto budget = std::chrono::milliseconds(std::max(m_options.budgetMs, 1));

    std::optional<std::future<Outcome>> future = m_pool->run<Outcome>(
        [strategy, query, candidates]() {
            QString error;
            std::optional<std::vector<double>> scores = strategy->score(query, candidates, &error);
            return Outcome{std::move(scores), error};
        },
        TaskPool::Clock::now() + budget);

    if (!future) {
        *reasonOut = QStringLiteral("%1 judge queue full").arg(strategy->name());
        return Attempt::Unavailable;
    }

    if (future->wait_for(budget) != std::future_status::ready) {
        *reasonOut = QStringLiteral("%1 judge exceeded %2 ms budget")
                         .arg(strategy->name()).arg(budget.count());
        return Attempt::TimedOut;
    }

    try {
        Outcome outcome = future->get();
        if (!outcome.first || outcome.first->size() != candidates.size()) {
            *reasonOut = outcome.second.isEmpty()
                ? QStringLiteral("%1 judge failed").arg(strategy->name())
                : outcome.second;
            return Attempt::Failed;
        }
        *scoresOut = std::move(outcome.first.value());
        return Attempt::Served;
    } catch (const std::future_error&) {
        // Dequeued after its deadline.
        *reasonOut = QStringLiteral("%1 judge exceeded %2 ms budget")
                         .arg(strategy->name()).arg(budget.count());
        return Attempt::TimedOut;
    } catch (const std::exception& e) {
        *reasonOut = QStringLiteral("%1 judge error: %2").arg(strategy->name(), QString::fromUtf8(e.what()));
        return Attempt::Failed;
    }
}

JudgeResult JudgeChain::judge(const QString& query, const std::vector<Candidate>& candidates,
                              JudgeMode requested)
{
    JudgeResult result;
    result.report.requested = requested;
    result.report.judged = static_cast<int>(candidates.size());

    QStringList reasons;
    for (const std::shared_ptr<JudgeStrategy>& strategy : chainFor(requested)) {
        if (!strategy) {
            continue;
        }
        result.report.attempted << strategy->name();
        if (!strategy->isAvailable()) {
            reasons << QStringLiteral("%1 judge unavailable").arg(strategy->name());
            continue;
        }

        const int64_t before = strategy->invocations();
        std::vector<double> scores;
        QString reason;
        Attempt attempt = Attempt::Served;
        if (strategy == m_real) {
            attempt = runPooled(strategy, query, candidates, &scores, &reason);
        } else {
            std::optional<std::vector<double>> direct = strategy->score(query, candidates, &reason);
            if (direct && direct->size() == candidates.size()) {
                scores = std::move(direct.value());
            } else {
                attempt = Attempt::Failed;
            }
        }
        result.report.invocations += strategy->invocations() - before;

        if (attempt == Attempt::Served) {
            result.scores = std::move(scores);
            result.report.servedBy = strategy->name();
            break;
        }

        reasons << reason;
        if (attempt == Attempt::TimedOut) {
            result.report.timedOut = true;
            break;
        }
    }

    if (result.report.servedBy.isEmpty()) {
        // Nothing served (or the model timed out): fused order stands.
        std::optional<std::vector<double>> fused = m_off->score(query, candidates);
        result.scores = fused ? std::move(fused.value()) : std::vector<double>(candidates.size(), 0.0);
        result.report.servedBy = m_off->name();
    }

    result.report.degraded = result.report.servedBy != judgeModeToString(requested);
    result.report.fallbackReason = reasons.join(QStringLiteral("; "));
    if (result.report.degraded) {
        LOG_INFO(slRanking, "judge degraded: requested=%s served_by=%s (%s)",
                 qPrintable(judgeModeToString(requested)), qPrintable(result.report.servedBy),
                 qPrintable(result.report.fallbackReason));
    }
    return result;
}

QJsonObject JudgeChain::status() const
{
    const TaskPool::Counters counters = m_pool->counters();
    QJsonObject json;
    json[QStringLiteral("real_available")] = realAvailable();
    json[QStringLiteral("workers")] = m_pool->workerCount();
    json[QStringLiteral("queue_limit")] = m_pool->queueLimit();
    json[QStringLiteral("queue_depth")] = m_pool->queueDepth();
    json[QStringLiteral("budget_ms")] = m_options.budgetMs;
    json[QStringLiteral("submitted")] = static_cast<qint64>(counters.submitted);
    json[QStringLiteral("rejected")] = static_cast<qint64>(counters.rejected);
    json[QStringLiteral("expired")] = static_cast<qint64>(counters.expired);
    return json;
}

} // namespace sl
