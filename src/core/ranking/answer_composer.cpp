#include "core/ranking/answer_composer.h"

#include <QStringList>

namespace sl {

QString AnswerComposer::abstainText()
{
    return QStringLiteral("Abstain: no direct evidence to answer confidently.");
}

ComposedAnswer AnswerComposer::compose(const Estimate& estimate, int maxSources)
{
    ComposedAnswer answer;
    if (estimate.noEvidence || estimate.hits.empty()) {
        answer.text = abstainText();
        return answer;
    }

    QStringList parts;
    for (const EvidenceHit& hit : estimate.hits) {
        if (static_cast<int>(answer.sources.size()) >= maxSources) {
            break;
        }
        const ChunkRecord& chunk = hit.candidate.chunk;
        const QString title = chunk.title.isEmpty() ? QStringLiteral("Unknown book") : chunk.title;
        parts << (chunk.section.isEmpty() ? title : title + QStringLiteral(" - ") + chunk.section);
        answer.sources.push_back(hit);
    }

    answer.text = QStringLiteral("Sources: ") + parts.join(QStringLiteral("; "));
    answer.abstained = false;
    return answer;
}

} // namespace sl
