#include "daemon/change_classifier.hpp"

#include "daemon/keyword_matcher.hpp"

namespace pagewatch {

namespace {

SnapshotAction writeAction(const std::string &text)
{
    SnapshotAction action;
    action.kind = SnapshotActionKind::Write;
    action.text = text;
    return action;
}

} // namespace

Classification ChangeClassifier::classify(const Target &target,
                                          const std::string &extractedText,
                                          const std::optional<Snapshot> &prior)
{
    Classification classification;
    classification.result.url = target.url;

    if (!prior.has_value()) {
        classification.result.status = CheckStatus::Initialized;
        classification.action = writeAction(extractedText);
        return classification;
    }

    // Equality first: an unchanged page never costs a keyword scan or a write.
    if (extractedText == prior->text) {
        classification.result.status = CheckStatus::NoChange;
        return classification;
    }

    auto matched = matchKeywords(extractedText, target.keywords);
    if (!matched.empty()) {
        classification.result.status = CheckStatus::KeywordChange;
        classification.result.matchedKeywords = std::move(matched);
    } else {
        classification.result.status = CheckStatus::ChangedButNoKeywords;
    }
    classification.action = writeAction(extractedText);
    return classification;
}

} // namespace pagewatch
