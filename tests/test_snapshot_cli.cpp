#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <vector>

#include <nlohmann/json.hpp>

#include "cli/SnapshotCli.hpp"
#include "common/logging.hpp"
#include "fake_command_runner.hpp"
#include "output/gzip_codec.hpp"

class SnapshotCliTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testHelp();
    void testUnknownOption();
    void testTwoFilenames();
    void testRequestsTestMode();
    void testDryRunWritesNothing_data();
    void testDryRunWritesNothing();
    void testWritesDefaultFileName();
    void testWritesCompressedNamedFile();
    void testDetailedJson();
    void testMissingTool();
    void testUnsupportedManager();
    void testEmptyInventory();
    void testListingFailure();

private:
    int runCli(pkgsnap::PackageManagerKind kind, FakeCommandRunner &runner,
               const QStringList &flags);
    static void registerAptListing(FakeCommandRunner &runner);
    QStringList workEntries() const;

    QTemporaryDir m_tempDir;
    QString m_workDir;
    QString m_prevCwd;
    QByteArray m_prevHome;
};

void SnapshotCliTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.filePath(QStringLiteral("home")).toUtf8());
    pkgsnap::logging::initLogging(QStringLiteral("pkgsnap-test"), false);

    m_workDir = m_tempDir.filePath(QStringLiteral("work"));
    QVERIFY(QDir().mkpath(m_workDir));
    m_prevCwd = QDir::currentPath();
    QVERIFY(QDir::setCurrent(m_workDir));
}

void SnapshotCliTests::cleanupTestCase()
{
    QDir::setCurrent(m_prevCwd);
    pkgsnap::logging::setFileLoggingEnabled(true);
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void SnapshotCliTests::init()
{
    pkgsnap::logging::setFileLoggingEnabled(true);
    QDir(m_tempDir.filePath(QStringLiteral("home"))).removeRecursively();
    QDir work(m_workDir);
    for (const QString &entry : workEntries()) {
        const QString path = work.filePath(entry);
        if (QFileInfo(path).isDir()) {
            QDir(path).removeRecursively();
        } else {
            QFile::remove(path);
        }
    }
}

int SnapshotCliTests::runCli(pkgsnap::PackageManagerKind kind, FakeCommandRunner &runner,
                             const QStringList &flags)
{
    pkgsnap::RunConfig config;
    config.forcedManager = kind;

    pkgsnap::SnapshotCli cli(config);
    cli.setCommandRunner(&runner);

    std::vector<QByteArray> localArgs;
    localArgs.push_back(QByteArrayLiteral("pkgsnap"));
    for (const QString &flag : flags) {
        localArgs.push_back(flag.toLocal8Bit());
    }
    std::vector<char *> rawArgs;
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}

void SnapshotCliTests::registerAptListing(FakeCommandRunner &runner)
{
    runner.setResult(QStringLiteral("dpkg-query"), aptListArguments(),
                     FakeCommandRunner::ok(QStringLiteral("bash\t5.1-2\ncurl\t7.81.0-1\n")));
}

QStringList SnapshotCliTests::workEntries() const
{
    return QDir(m_workDir).entryList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden);
}

void SnapshotCliTests::testHelp()
{
    FakeCommandRunner runner;
    QCOMPARE(runCli(pkgsnap::PackageManagerKind::Apt, runner, {QStringLiteral("--help")}), 0);
    QVERIFY(runner.calls().empty());
    QVERIFY(workEntries().isEmpty());
}

void SnapshotCliTests::testUnknownOption()
{
    FakeCommandRunner runner;
    registerAptListing(runner);
    QCOMPARE(runCli(pkgsnap::PackageManagerKind::Apt, runner, {QStringLiteral("--xml")}), 1);
    QVERIFY(runner.calls().empty());
}

void SnapshotCliTests::testTwoFilenames()
{
    FakeCommandRunner runner;
    registerAptListing(runner);
    QCOMPARE(runCli(pkgsnap::PackageManagerKind::Apt, runner,
                    {QStringLiteral("a.txt"), QStringLiteral("b.txt")}),
             1);
    QVERIFY(runner.calls().empty());
    QVERIFY(workEntries().isEmpty());
}

void SnapshotCliTests::testRequestsTestMode()
{
    using pkgsnap::SnapshotCli;
    QVERIFY(SnapshotCli::requestsTestMode({QStringLiteral("pkgsnap"), QStringLiteral("--test")}));
    QVERIFY(SnapshotCli::requestsTestMode(
        {QStringLiteral("pkgsnap"), QStringLiteral("--json"), QStringLiteral("-test")}));
    QVERIFY(!SnapshotCli::requestsTestMode({QStringLiteral("pkgsnap"), QStringLiteral("--json")}));
    QVERIFY(!SnapshotCli::requestsTestMode(
        {QStringLiteral("pkgsnap"), QStringLiteral("--"), QStringLiteral("--test")}));
}

void SnapshotCliTests::testDryRunWritesNothing_data()
{
    QTest::addColumn<QStringList>("flags");

    QTest::newRow("text") << QStringList{"--test"};
    QTest::newRow("json") << QStringList{"--test", "--json"};
    QTest::newRow("gzip") << QStringList{"--test", "--gzip"};
    QTest::newRow("json gzip detailed")
        << QStringList{"--test", "--json", "--gzip", "--detailed"};
    QTest::newRow("named detailed") << QStringList{"--detailed", "--test", "named.txt"};
    QTest::newRow("single dash") << QStringList{"-test", "-json", "-gzip"};
}

void SnapshotCliTests::testDryRunWritesNothing()
{
    QFETCH(QStringList, flags);

    FakeCommandRunner runner;
    registerAptListing(runner);

    QCOMPARE(runCli(pkgsnap::PackageManagerKind::Apt, runner, flags), 0);
    QCOMPARE(runner.callCount(QStringLiteral("dpkg-query")), 1);
    QVERIFY(workEntries().isEmpty());
    QVERIFY(!QDir(pkgsnap::logging::logsDirPath()).exists());
}

void SnapshotCliTests::testWritesDefaultFileName()
{
    FakeCommandRunner runner;
    registerAptListing(runner);

    QCOMPARE(runCli(pkgsnap::PackageManagerKind::Apt, runner, {QStringLiteral("--json")}), 0);

    const QStringList entries = workEntries();
    QCOMPARE(entries.size(), 1);
    const QRegularExpression namePattern(
        QStringLiteral(R"(^packages_\d{4}-\d{2}-\d{2}_\d{2}-\d{2}-\d{2}\.json$)"));
    QVERIFY2(namePattern.match(entries.front()).hasMatch(), qPrintable(entries.front()));

    QFile file(QDir(m_workDir).filePath(entries.front()));
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto parsed = nlohmann::json::parse(file.readAll().toStdString());
    QCOMPARE(QString::fromStdString(parsed.at("package_manager").get<std::string>()),
             QStringLiteral("apt"));
    QCOMPARE(parsed.at("packages").size(), static_cast<size_t>(2));
    QVERIFY(!parsed.at("packages").at("bash").contains("description"));

    QVERIFY(QFile::exists(pkgsnap::logging::logsDirPath() + "/pkgsnap-test.log"));
}

void SnapshotCliTests::testWritesCompressedNamedFile()
{
    FakeCommandRunner runner;
    registerAptListing(runner);

    QCOMPARE(runCli(pkgsnap::PackageManagerKind::Apt, runner,
                    {QStringLiteral("--gzip"), QStringLiteral("inventory.txt")}),
             0);
    QCOMPARE(workEntries(), QStringList{QStringLiteral("inventory.txt.gz")});

    QFile file(QDir(m_workDir).filePath(QStringLiteral("inventory.txt.gz")));
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto text = pkgsnap::gzipDecompress(file.readAll());
    QVERIFY(text.has_value());
    QVERIFY(text->contains("bash (5.1-2)\ncurl (7.81.0-1)\n"));
}

void SnapshotCliTests::testDetailedJson()
{
    FakeCommandRunner runner;
    runner.setResult(QStringLiteral("pacman"), {QStringLiteral("-Q")},
                     FakeCommandRunner::ok(QStringLiteral("curl 8.5.0-1\nfilesystem 2024.01.19-1\n")));
    runner.setResult(QStringLiteral("pacman"), {QStringLiteral("-Qi"), QStringLiteral("curl")},
                     FakeCommandRunner::ok(QStringLiteral(
                         "Name            : curl\n"
                         "Description     : command line tool and library\n"
                         "Depends On      : openssl  zlib\n")));
    runner.setResult(QStringLiteral("pacman"),
                     {QStringLiteral("-Qi"), QStringLiteral("filesystem")},
                     FakeCommandRunner::failed(1, QStringLiteral("error: package not found")));

    QCOMPARE(runCli(pkgsnap::PackageManagerKind::Pacman, runner,
                    {QStringLiteral("--json"), QStringLiteral("--detailed"),
                     QStringLiteral("snap.json")}),
             0);

    QFile file(QDir(m_workDir).filePath(QStringLiteral("snap.json")));
    QVERIFY(file.open(QIODevice::ReadOnly));
    const auto parsed = nlohmann::json::parse(file.readAll().toStdString());
    const auto &packages = parsed.at("packages");
    QCOMPARE(QString::fromStdString(packages.at("curl").at("description").get<std::string>()),
             QStringLiteral("command line tool and library"));
    QCOMPARE(packages.at("curl").at("dependencies").size(), static_cast<size_t>(2));
    QVERIFY(!packages.at("filesystem").contains("description"));
    QCOMPARE(QString::fromStdString(packages.at("filesystem").at("version").get<std::string>()),
             QStringLiteral("2024.01.19-1"));
}

void SnapshotCliTests::testMissingTool()
{
    FakeCommandRunner runner;
    registerAptListing(runner);
    runner.setMissing(QStringLiteral("dpkg-query"));

    QCOMPARE(runCli(pkgsnap::PackageManagerKind::Apt, runner, {}), 1);
    QVERIFY(runner.calls().empty());
    QVERIFY(workEntries().isEmpty());
}

void SnapshotCliTests::testUnsupportedManager()
{
    FakeCommandRunner runner;
    QCOMPARE(runCli(pkgsnap::PackageManagerKind::Zypper, runner, {}), 1);
    QCOMPARE(runCli(pkgsnap::PackageManagerKind::Unknown, runner, {QStringLiteral("--json")}),
             1);
    QVERIFY(runner.calls().empty());
    QVERIFY(workEntries().isEmpty());
}

void SnapshotCliTests::testEmptyInventory()
{
    FakeCommandRunner runner;
    runner.setResult(QStringLiteral("rpm"), rpmListArguments(),
                     FakeCommandRunner::ok(QString()));

    QCOMPARE(runCli(pkgsnap::PackageManagerKind::Yum, runner, {}), 1);
    QVERIFY(workEntries().isEmpty());
}

void SnapshotCliTests::testListingFailure()
{
    FakeCommandRunner runner;
    runner.setResult(QStringLiteral("dpkg-query"), aptListArguments(),
                     FakeCommandRunner::failed(2, QStringLiteral("dpkg-query: error")));

    QCOMPARE(runCli(pkgsnap::PackageManagerKind::Apt, runner, {QStringLiteral("--json")}), 1);
    QVERIFY(workEntries().isEmpty());
}

QTEST_MAIN(SnapshotCliTests)
#include "test_snapshot_cli.moc"
