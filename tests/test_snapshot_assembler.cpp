#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <utility>
#include <vector>

#include "collector/package_backend.hpp"
#include "collector/snapshot_assembler.hpp"
#include "common/errors.hpp"
#include "fake_command_runner.hpp"

class SnapshotAssemblerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();

    void testVersionsOnly();
    void testDetailedWithFailedFetch();
    void testEmptyListingFails();
    void testProgressIsMonotonic();
    void testDryRunReportsNoProgress();
    void testTimestampFormat();

private:
    static pkgsnap::PackageListing bashAndCurl();

    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void SnapshotAssemblerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void SnapshotAssemblerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

pkgsnap::PackageListing SnapshotAssemblerTests::bashAndCurl()
{
    return {{"bash", "5.1-2"}, {"curl", "7.81.0-1"}};
}

void SnapshotAssemblerTests::testVersionsOnly()
{
    FakeCommandRunner runner;
    const pkgsnap::SnapshotAssembler assembler(
        pkgsnap::backendFor(pkgsnap::PackageManagerKind::Apt), runner);

    pkgsnap::SystemMetadata metadata;
    metadata.hostname = "build-01";

    const auto snapshot = assembler.assemble(bashAndCurl(), metadata, {});

    QCOMPARE(snapshot.packageManager, pkgsnap::PackageManagerKind::Apt);
    QCOMPARE(snapshot.packages.size(), static_cast<size_t>(2));
    QCOMPARE(QString::fromStdString(snapshot.packages.at("curl").version),
             QStringLiteral("7.81.0-1"));
    QCOMPARE(QString::fromStdString(snapshot.packages.at("curl").name), QStringLiteral("curl"));
    QVERIFY(!snapshot.packages.at("bash").description.has_value());
    QVERIFY(!snapshot.packages.at("bash").dependencies.has_value());
    QCOMPARE(QString::fromStdString(snapshot.metadata.hostname), QStringLiteral("build-01"));
    QVERIFY(!snapshot.timestamp.empty());
    QVERIFY(runner.calls().empty());
}

void SnapshotAssemblerTests::testDetailedWithFailedFetch()
{
    FakeCommandRunner runner;
    runner.setResult(QStringLiteral("apt-cache"),
                     {QStringLiteral("show"), QStringLiteral("bash")},
                     FakeCommandRunner::ok(QStringLiteral(
                         "Package: bash\n"
                         "Depends: base-files (>= 2.1.12), debianutils (>= 5.6-0.1)\n"
                         "Description: GNU Bourne Again SHell\n")));
    runner.setResult(QStringLiteral("apt-cache"),
                     {QStringLiteral("show"), QStringLiteral("curl")},
                     FakeCommandRunner::failed(100, QStringLiteral("E: No packages found")));

    const pkgsnap::SnapshotAssembler assembler(
        pkgsnap::backendFor(pkgsnap::PackageManagerKind::Apt), runner);

    pkgsnap::AssemblyOptions options;
    options.detailed = true;
    const auto snapshot = assembler.assemble(bashAndCurl(), {}, options);

    QCOMPARE(snapshot.packages.size(), static_cast<size_t>(2));

    const auto &bash = snapshot.packages.at("bash");
    QCOMPARE(QString::fromStdString(bash.description.value_or("")),
             QStringLiteral("GNU Bourne Again SHell"));
    QCOMPARE(bash.dependencies->size(), static_cast<size_t>(2));

    const auto &curl = snapshot.packages.at("curl");
    QCOMPARE(QString::fromStdString(curl.version), QStringLiteral("7.81.0-1"));
    QVERIFY(!curl.description.has_value());
    QVERIFY(!curl.dependencies.has_value());

    QCOMPARE(runner.callCount(QStringLiteral("apt-cache")), 2);
}

void SnapshotAssemblerTests::testEmptyListingFails()
{
    FakeCommandRunner runner;
    const pkgsnap::SnapshotAssembler assembler(
        pkgsnap::backendFor(pkgsnap::PackageManagerKind::Pacman), runner);

    pkgsnap::AssemblyOptions options;
    options.detailed = true;
    QVERIFY_THROWS_EXCEPTION(pkgsnap::EmptyInventoryError,
                             assembler.assemble({}, {}, options));
    QVERIFY(runner.calls().empty());
}

void SnapshotAssemblerTests::testProgressIsMonotonic()
{
    FakeCommandRunner runner;
    const pkgsnap::SnapshotAssembler assembler(
        pkgsnap::backendFor(pkgsnap::PackageManagerKind::Pacman), runner);

    std::vector<std::pair<std::size_t, std::size_t>> reports;
    pkgsnap::AssemblyOptions options;
    options.detailed = true;
    options.progress = [&reports](std::size_t processed, std::size_t total) {
        reports.emplace_back(processed, total);
    };

    const pkgsnap::PackageListing listing{
        {"glibc", "2.39-1"}, {"linux", "6.7.1.arch1-1"}, {"mesa", "1:23.3.3-1"}};
    assembler.assemble(listing, {}, options);

    QCOMPARE(reports.size(), static_cast<size_t>(3));
    for (std::size_t i = 0; i < reports.size(); ++i) {
        QCOMPARE(reports.at(i).first, i + 1);
        QCOMPARE(reports.at(i).second, static_cast<size_t>(3));
    }
}

void SnapshotAssemblerTests::testDryRunReportsNoProgress()
{
    FakeCommandRunner runner;
    const pkgsnap::SnapshotAssembler assembler(
        pkgsnap::backendFor(pkgsnap::PackageManagerKind::Yum), runner);

    int reports = 0;
    pkgsnap::AssemblyOptions options;
    options.detailed = true;
    options.dryRun = true;
    options.progress = [&reports](std::size_t, std::size_t) { ++reports; };

    const auto snapshot = assembler.assemble(bashAndCurl(), {}, options);
    QCOMPARE(snapshot.packages.size(), static_cast<size_t>(2));
    QCOMPARE(reports, 0);

    options.dryRun = false;
    options.detailed = false;
    assembler.assemble(bashAndCurl(), {}, options);
    QCOMPARE(reports, 0);
}

void SnapshotAssemblerTests::testTimestampFormat()
{
    FakeCommandRunner runner;
    const pkgsnap::SnapshotAssembler assembler(
        pkgsnap::backendFor(pkgsnap::PackageManagerKind::Apt), runner);

    pkgsnap::AssemblyOptions options;
    options.capturedAt = QDateTime(QDate(2024, 5, 1), QTime(9, 5, 7));
    const auto snapshot = assembler.assemble(bashAndCurl(), {}, options);

    QCOMPARE(QString::fromStdString(snapshot.timestamp), QStringLiteral("2024-05-01 09:05:07"));
}

QTEST_MAIN(SnapshotAssemblerTests)
#include "test_snapshot_assembler.moc"
