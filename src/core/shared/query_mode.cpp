#include "core/shared/query_mode.h"

namespace sl {

std::optional<QueryMode> queryModeFromString(const QString& value)
{
    const QString normalized = value.trimmed().toLower();
    if (normalized == QLatin1String("quick")) {
        return QueryMode::Quick;
    }
    if (normalized == QLatin1String("balanced")) {
        return QueryMode::Balanced;
    }
    if (normalized == QLatin1String("thorough")) {
        return QueryMode::Thorough;
    }
    return std::nullopt;
}

QString queryModeToString(QueryMode mode)
{
    switch (mode) {
    case QueryMode::Quick:    return QStringLiteral("quick");
    case QueryMode::Balanced: return QStringLiteral("balanced");
    case QueryMode::Thorough: return QStringLiteral("thorough");
    }
    return QStringLiteral("balanced");
}

ModeTable::ModeTable()
{
    m_profiles[static_cast<size_t>(QueryMode::Quick)] =
        ModeProfile{8, 16, 24, 24, 0.55, JudgeMode::Off};
    m_profiles[static_cast<size_t>(QueryMode::Balanced)] =
        ModeProfile{10, 20, 30, 30, 0.55, JudgeMode::Proxy};
    m_profiles[static_cast<size_t>(QueryMode::Thorough)] =
        ModeProfile{12, 28, 40, 40, 0.55, JudgeMode::Real};
}

const ModeProfile& ModeTable::profile(QueryMode mode) const
{
    return m_profiles[static_cast<size_t>(mode)];
}

void ModeTable::setProfile(QueryMode mode, const ModeProfile& profile)
{
    m_profiles[static_cast<size_t>(mode)] = profile;
}

} // namespace sl
