#include <QtTest>
#include <QTemporaryDir>
#include "core/PopupOptions.hpp"
#include "core/StyleConfig.hpp"

using creak::PopupOptions;
using creak::StyleConfig;

class TestStyleConfig : public QObject {
    Q_OBJECT
private slots:
    void testDefaults();
    void testDefaultsApply();
    void testLoadMergesOverDefaults();
    void testApplyFromFile();
    void testInvalidPositionRejected();
    void testInvalidScalarsRejected();
    void testTimeoutCappedAtIntMax();
    void testMalformedFileRejected();
    void testMissingFileRejected();
    void testUnknownKeysIgnored();
    void testMapReplacedByScalarRejected();
    void testResolvePath();
    void testConfigHomeFollowsXdg();
    void testParseHexColor();
};

static QString dataFile(const char* name)
{
    return QString(TEST_DATA_DIR) + "/" + name;
}

static QString writeTemp(QTemporaryDir& dir, const QByteArray& yaml)
{
    const QString path = dir.filePath("style.yaml");
    QFile file(path);
    if (file.open(QIODevice::WriteOnly))
        file.write(yaml);
    return path;
}

void TestStyleConfig::testDefaults()
{
    StyleConfig config;
    QCOMPARE(config.position(), QString("top"));
    QCOMPARE(config.timeoutMs(), 5000);
    QCOMPARE(config.width(), 350);
    QCOMPARE(config.font(), QString("Sans 16"));
    QCOMPARE(config.padding(), 10);
    QCOMPARE(config.borderSize(), 5);
    QCOMPARE(config.borderRadius(), 10);
    QCOMPARE(config.backgroundColor(), QString("#1A1A1AFF"));
    QCOMPARE(config.stackEnabled(), true);
    QCOMPARE(config.stackGap(), 10);
    QCOMPARE(config.defaultOffset(), 20);
    QCOMPARE(config.edgeMargin(), 20);
    QCOMPARE(config.textHint(), QString("default"));
    QVERIFY(config.stateDir().isEmpty());
}

void TestStyleConfig::testDefaultsApply()
{
    StyleConfig config;
    PopupOptions options;
    options.name = "kept";
    QString error;
    QVERIFY2(config.applyTo(options, &error), qPrintable(error));

    const PopupOptions builtIn;
    QCOMPARE(options.edge, builtIn.edge);
    QCOMPARE(options.timeoutMs, builtIn.timeoutMs);
    QCOMPARE(options.style.background, builtIn.style.background);
    QCOMPARE(options.style.text, builtIn.style.text);
    QCOMPARE(options.defaultOffset, builtIn.defaultOffset);
    QCOMPARE(options.name, QString("kept"));
}

void TestStyleConfig::testLoadMergesOverDefaults()
{
    StyleConfig config;
    QString error;
    QVERIFY2(config.load(dataFile("test_style.yaml"), &error), qPrintable(error));

    QCOMPARE(config.position(), QString("bottom-right"));
    QCOMPARE(config.timeoutMs(), 8000);
    QCOMPARE(config.borderRadius(), 4);
    QCOMPARE(config.stackGap(), 6);
    // Siblings of overridden keys keep their defaults.
    QCOMPARE(config.borderSize(), 5);
    QCOMPARE(config.edgeMargin(), 20);
    QCOMPARE(config.borderColor(), QString("#FFFFFFFF"));
    QCOMPARE(config.width(), 350);
    QVERIFY(config.unknownKeys().isEmpty());
}

void TestStyleConfig::testApplyFromFile()
{
    StyleConfig config;
    QVERIFY(config.load(dataFile("test_style.yaml")));

    PopupOptions options;
    QString error;
    QVERIFY2(config.applyTo(options, &error), qPrintable(error));
    QCOMPARE(options.edge, creak::Edge::BottomRight);
    QCOMPARE(options.timeoutMs, 8000);
    QCOMPARE(options.stackGap, 6);
    QCOMPARE(options.defaultOffset, 40);
    QCOMPARE(options.style.font, QString("DejaVu Sans 12"));
    QCOMPARE(options.style.background, QColor(0x20, 0x20, 0x20, 0xe0));
    QCOMPARE(options.style.text, QColor(0, 255, 0));
    QCOMPARE(options.style.hint, creak::TextHint::Slight);
}

void TestStyleConfig::testInvalidPositionRejected()
{
    StyleConfig config;
    QVERIFY(config.load(dataFile("test_style_invalid.yaml")));

    PopupOptions options;
    options.timeoutMs = 123;
    QString error;
    QVERIFY(!config.applyTo(options, &error));
    QVERIFY(error.contains("sideways"));
    QCOMPARE(options.timeoutMs, 123);
}

void TestStyleConfig::testInvalidScalarsRejected()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    PopupOptions options;
    QString error;

    StyleConfig config;
    QVERIFY(config.load(writeTemp(dir, "width: wide\n")));
    QVERIFY(!config.applyTo(options, &error));
    QVERIFY(error.contains("width"));

    QVERIFY(config.load(writeTemp(dir, "stack:\n  gap: -4\n")));
    QVERIFY(!config.applyTo(options, &error));
    QVERIFY(error.contains("stack.gap"));

    QVERIFY(config.load(writeTemp(dir, "colors:\n  border: \"#12\"\n")));
    QVERIFY(!config.applyTo(options, &error));
    QVERIFY(error.contains("colors.border"));

    QVERIFY(config.load(writeTemp(dir, "stack:\n  enabled: maybe\n")));
    QVERIFY(!config.applyTo(options, &error));

    QVERIFY(config.load(writeTemp(dir, "text:\n  antialias: blurry\n")));
    QVERIFY(!config.applyTo(options, &error));
}

void TestStyleConfig::testTimeoutCappedAtIntMax()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    PopupOptions options;
    options.timeoutMs = 123;
    QString error;

    StyleConfig config;
    QVERIFY(config.load(writeTemp(dir, "timeout_ms: 9999999999\n")));
    QVERIFY(!config.applyTo(options, &error));
    QVERIFY(error.contains("timeout_ms"));
    QCOMPARE(options.timeoutMs, 123);

    QVERIFY(config.load(writeTemp(dir, "timeout_ms: 2147483647\n")));
    QVERIFY(config.applyTo(options, &error));
    QCOMPARE(options.timeoutMs, qint64(2147483647));
}

void TestStyleConfig::testMalformedFileRejected()
{
    StyleConfig config;
    QString error;
    QVERIFY(!config.load(dataFile("test_style_malformed.yaml"), &error));
    QVERIFY(error.contains("test_style_malformed.yaml"));
    // Defaults survive a failed load.
    QCOMPARE(config.width(), 350);
}

void TestStyleConfig::testMissingFileRejected()
{
    StyleConfig config;
    QString error;
    QVERIFY(!config.load(dataFile("no_such_style.yaml"), &error));
    QVERIFY(!error.isEmpty());
}

void TestStyleConfig::testUnknownKeysIgnored()
{
    StyleConfig config;
    QVERIFY(config.load(dataFile("test_style_unknown_key.yaml")));
    QCOMPARE(config.width(), 420);
    QCOMPARE(config.stackGap(), 3);
    QCOMPARE(config.unknownKeys(), (QStringList{"shadow", "stack.spin"}));

    PopupOptions options;
    QVERIFY(config.applyTo(options));
}

void TestStyleConfig::testMapReplacedByScalarRejected()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    StyleConfig config;
    QString error;
    QVERIFY(!config.load(writeTemp(dir, "border: 3\n"), &error));
    QVERIFY(error.contains("border"));
    QCOMPARE(config.borderSize(), 5);
}

void TestStyleConfig::testResolvePath()
{
    QCOMPARE(StyleConfig::resolvePath(QString(), "/home/u/.config"),
             QString("/home/u/.config/creak/config.yaml"));
    QCOMPARE(StyleConfig::resolvePath("urgent", "/home/u/.config"),
             QString("/home/u/.config/creak/urgent.yaml"));
    QCOMPARE(StyleConfig::resolvePath("./styles/urgent.yaml", "/home/u/.config"),
             QString("./styles/urgent.yaml"));
    QCOMPARE(StyleConfig::resolvePath("/etc/creak/quiet.yaml", "/home/u/.config"),
             QString("/etc/creak/quiet.yaml"));
}

void TestStyleConfig::testConfigHomeFollowsXdg()
{
    const QByteArray saved = qgetenv("XDG_CONFIG_HOME");
    qputenv("XDG_CONFIG_HOME", "/tmp/xdg-config");
    QCOMPARE(StyleConfig::configHome(), QString("/tmp/xdg-config"));
    qunsetenv("XDG_CONFIG_HOME");
    QCOMPARE(StyleConfig::configHome(), QDir::homePath() + "/.config");
    if (!saved.isEmpty())
        qputenv("XDG_CONFIG_HOME", saved);
}

void TestStyleConfig::testParseHexColor()
{
    QColor color;
    QVERIFY(creak::parseHexColor("#1A1A1AFF", &color));
    QCOMPARE(color, QColor(0x1a, 0x1a, 0x1a, 0xff));
    QVERIFY(creak::parseHexColor("ff000080", &color));
    QCOMPARE(color.alpha(), 0x80);
    QCOMPARE(color.red(), 255);
    QVERIFY(!creak::parseHexColor("#fff", &color));
    QVERIFY(!creak::parseHexColor("#gg0000", &color));
    QVERIFY(!creak::parseHexColor("#-10000", &color));
}

QTEST_GUILESS_MAIN(TestStyleConfig)
#include "test_style_config.moc"
