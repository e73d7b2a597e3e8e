#include <QtTest/QtTest>

#include "daemon/change_classifier.hpp"

using pagewatch::ChangeClassifier;
using pagewatch::CheckStatus;
using pagewatch::SnapshotActionKind;

namespace {

pagewatch::Target makeTarget(std::vector<std::string> keywords)
{
    pagewatch::Target target;
    target.url = "https://example.com";
    target.keywords = std::move(keywords);
    return target;
}

pagewatch::Snapshot makeSnapshot(const std::string &text)
{
    pagewatch::Snapshot snapshot;
    snapshot.timestamp = std::chrono::system_clock::now();
    snapshot.text = text;
    return snapshot;
}

} // namespace

class ChangeClassifierTests : public QObject
{
    Q_OBJECT
private slots:
    void testFirstObservationInitializes();
    void testUnchangedTextWritesNothing();
    void testKeywordChange();
    void testChangeWithoutKeywords();
    void testEmptyTextIsAValue();
};

void ChangeClassifierTests::testFirstObservationInitializes()
{
    const auto classification = ChangeClassifier::classify(makeTarget({"layoffs"}),
                                                           "Welcome to Example",
                                                           std::nullopt);
    QCOMPARE(classification.result.status, CheckStatus::Initialized);
    QCOMPARE(QString::fromStdString(classification.result.url),
             QStringLiteral("https://example.com"));
    QVERIFY(!classification.result.details.has_value());
    QVERIFY(classification.result.matchedKeywords.empty());
    QCOMPARE(classification.action.kind, SnapshotActionKind::Write);
    QCOMPARE(QString::fromStdString(classification.action.text),
             QStringLiteral("Welcome to Example"));
}

void ChangeClassifierTests::testUnchangedTextWritesNothing()
{
    // Keywords present in unchanged text do not matter.
    const auto classification = ChangeClassifier::classify(makeTarget({"welcome"}),
                                                           "Welcome to Example",
                                                           makeSnapshot("Welcome to Example"));
    QCOMPARE(classification.result.status, CheckStatus::NoChange);
    QCOMPARE(classification.action.kind, SnapshotActionKind::None);
}

void ChangeClassifierTests::testKeywordChange()
{
    const auto classification = ChangeClassifier::classify(
        makeTarget({"hiring", "layoffs", "merger"}),
        "Welcome to Example. Layoffs announced. Merger pending.",
        makeSnapshot("Welcome to Example"));
    QCOMPARE(classification.result.status, CheckStatus::KeywordChange);
    QCOMPARE(classification.result.matchedKeywords.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(classification.result.matchedKeywords.at(0)),
             QStringLiteral("layoffs"));
    QCOMPARE(QString::fromStdString(classification.result.matchedKeywords.at(1)),
             QStringLiteral("merger"));
    QCOMPARE(classification.action.kind, SnapshotActionKind::Write);
}

void ChangeClassifierTests::testChangeWithoutKeywords()
{
    const auto classification = ChangeClassifier::classify(makeTarget({"layoffs"}),
                                                           "Welcome to Example. New logo.",
                                                           makeSnapshot("Welcome to Example"));
    QCOMPARE(classification.result.status, CheckStatus::ChangedButNoKeywords);
    QVERIFY(classification.result.matchedKeywords.empty());
    QCOMPARE(classification.action.kind, SnapshotActionKind::Write);
    QCOMPARE(QString::fromStdString(classification.action.text),
             QStringLiteral("Welcome to Example. New logo."));
}

void ChangeClassifierTests::testEmptyTextIsAValue()
{
    const auto fromEmpty = ChangeClassifier::classify(makeTarget({}), "Now with text",
                                                      makeSnapshot(""));
    QCOMPARE(fromEmpty.result.status, CheckStatus::ChangedButNoKeywords);

    const auto stillEmpty = ChangeClassifier::classify(makeTarget({}), "", makeSnapshot(""));
    QCOMPARE(stillEmpty.result.status, CheckStatus::NoChange);

    const auto firstEmpty = ChangeClassifier::classify(makeTarget({}), "", std::nullopt);
    QCOMPARE(firstEmpty.result.status, CheckStatus::Initialized);
    QCOMPARE(firstEmpty.action.kind, SnapshotActionKind::Write);
}

QTEST_MAIN(ChangeClassifierTests)
#include "test_change_classifier.moc"
