#include "core/shared/evidence.h"

namespace sl {

QString tierToString(Tier tier)
{
    switch (tier) {
    case Tier::Strong: return QStringLiteral("Strong");
    case Tier::Solid:  return QStringLiteral("Solid");
    case Tier::Weak:   return QStringLiteral("Weak");
    case Tier::Poor:   return QStringLiteral("Poor");
    }
    return QStringLiteral("Poor");
}

QString coverageToString(Coverage coverage)
{
    switch (coverage) {
    case Coverage::High:   return QStringLiteral("HIGH");
    case Coverage::Medium: return QStringLiteral("MEDIUM");
    case Coverage::Low:    return QStringLiteral("LOW");
    }
    return QStringLiteral("LOW");
}

std::optional<SortKey> sortKeyFromString(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("judge")) {
        return SortKey::Judge;
    }
    if (normalized == QLatin1String("semantic")) {
        return SortKey::Semantic;
    }
    return std::nullopt;
}

QString sortKeyToString(SortKey key)
{
    return key == SortKey::Judge ? QStringLiteral("Judge") : QStringLiteral("Semantic");
}

std::optional<JudgeMode> judgeModeFromString(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("real")) {
        return JudgeMode::Real;
    }
    if (normalized == QLatin1String("proxy")) {
        return JudgeMode::Proxy;
    }
    if (normalized == QLatin1String("off")) {
        return JudgeMode::Off;
    }
    return std::nullopt;
}

QString judgeModeToString(JudgeMode mode)
{
    switch (mode) {
    case JudgeMode::Real:  return QStringLiteral("real");
    case JudgeMode::Proxy: return QStringLiteral("proxy");
    case JudgeMode::Off:   return QStringLiteral("off");
    }
    return QStringLiteral("off");
}

double sortValue(const EvidenceHit& hit, SortKey key)
{
    return key == SortKey::Judge ? hit.candidate.judgeScore : hit.candidate.sScore;
}

bool hitLess(const EvidenceHit& lhs, const EvidenceHit& rhs, SortKey key)
{
    const double a = sortValue(lhs, key);
    const double b = sortValue(rhs, key);
    if (a != b) {
        return a > b;
    }
    const ChunkRecord& l = lhs.candidate.chunk;
    const ChunkRecord& r = rhs.candidate.chunk;
    if (l.chunkIdx != r.chunkIdx) {
        return l.chunkIdx < r.chunkIdx;
    }
    if (l.book != r.book) {
        return l.book < r.book;
    }
    return l.publisher < r.publisher;
}

} // namespace sl
