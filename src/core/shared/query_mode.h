#pragma once

#include "core/shared/evidence.h"

#include <QString>

#include <array>
#include <optional>

namespace sl {

enum class QueryMode {
    Quick,
    Balanced,
    Thorough,
};

// Retrieval budgets for one operating mode.
struct ModeProfile {
    int finalK = 10;      // items kept by the diversity selector
    int mmrK = 20;        // fused working set handed to the selector
    int denseK = 30;
    int lexK = 30;
    double mmrLambda = 0.55;
    JudgeMode defaultJudgeMode = JudgeMode::Proxy;
};

std::optional<QueryMode> queryModeFromString(const QString& value);
QString queryModeToString(QueryMode mode);

// Fixed mode -> profile table, consulted once per query.
class ModeTable {
public:
    ModeTable();

    const ModeProfile& profile(QueryMode mode) const;
    void setProfile(QueryMode mode, const ModeProfile& profile);

    static constexpr std::array<QueryMode, 3> kAllModes = {
        QueryMode::Quick, QueryMode::Balanced, QueryMode::Thorough,
    };

private:
    std::array<ModeProfile, 3> m_profiles;
};

} // namespace sl
