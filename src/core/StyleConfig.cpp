#include "core/StyleConfig.hpp"
#include "core/PopupOptions.hpp"
#include <QDir>
#include <boost/log/trivial.hpp>
#include <climits>

namespace creak {

namespace {

// Maps recurse and must stay maps. Anything else in the overlay replaces the
// base value; a null overlay value keeps the default. Overlay keys the defaults do not know are
// collected in `unknown` and dropped.
YAML::Node mergeStyle(const YAML::Node& base, const YAML::Node& overlay,
                      const QString& prefix, QStringList& unknown)
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);

    if (base.IsMap() && !overlay.IsMap())
        throw YAML::Exception(overlay.Mark(), "'" + prefix.chopped(1).toStdString()
                                              + "' must be a mapping");
    if (!base.IsMap())
        return YAML::Clone(overlay);

    YAML::Node result = YAML::Clone(base);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        const QString path = prefix + QString::fromStdString(key);
        if (!base[key]) {
            unknown.append(path);
            continue;
        }
        result[key] = mergeStyle(base[key], it->second, path + QLatin1Char('.'), unknown);
    }
    return result;
}

QString stringAt(const YAML::Node& node, const char* fallback)
{
    return QString::fromStdString(node.as<std::string>(fallback));
}

} // namespace

StyleConfig::StyleConfig()
{
    initDefaults();
}

void StyleConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["position"] = "top";
    root_["timeout_ms"] = 5000;
    root_["width"] = 350;
    root_["font"] = "Sans 16";
    root_["padding"] = 10;

    root_["border"]["size"] = 5;
    root_["border"]["radius"] = 10;

    root_["colors"]["background"] = "#1A1A1AFF";
    root_["colors"]["text"] = "#FFFFFFFF";
    root_["colors"]["border"] = "#FFFFFFFF";

    root_["stack"]["enabled"] = true;
    root_["stack"]["gap"] = 10;
    root_["stack"]["default_offset"] = 20;
    root_["stack"]["edge_margin"] = 20;

    root_["text"]["antialias"] = "default";
    root_["text"]["hint"] = "default";

    root_["state_dir"] = "";
}

bool StyleConfig::load(const QString& filePath, QString* error)
{
    initDefaults();
    unknownKeys_.clear();

    const YAML::Node defaults = YAML::Clone(root_);
    QStringList unknown;
    try {
        const YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        if (loaded.IsDefined() && !loaded.IsNull() && !loaded.IsMap()) {
            if (error)
                *error = QStringLiteral("%1: top level must be a mapping").arg(filePath);
            return false;
        }
        root_ = mergeStyle(defaults, loaded, QString(), unknown);
    } catch (const YAML::Exception& e) {
        root_ = defaults;
        if (error)
            *error = QStringLiteral("%1: %2").arg(filePath, QString::fromStdString(e.what()));
        return false;
    }

    unknownKeys_ = unknown;
    for (const auto& key : unknownKeys_)
        BOOST_LOG_TRIVIAL(warning) << "StyleConfig: ignoring unknown key '" << key.toStdString()
                                   << "' in " << filePath.toStdString();
    return true;
}

// --- Accessors ---

QString StyleConfig::position() const
{
    return stringAt(root_["position"], "top");
}

qint64 StyleConfig::timeoutMs() const
{
    return root_["timeout_ms"].as<qint64>(5000);
}

int StyleConfig::width() const
{
    return root_["width"].as<int>(350);
}

QString StyleConfig::font() const
{
    return stringAt(root_["font"], "Sans 16");
}

int StyleConfig::padding() const
{
    return root_["padding"].as<int>(10);
}

int StyleConfig::borderSize() const
{
    return root_["border"]["size"].as<int>(5);
}

int StyleConfig::borderRadius() const
{
    return root_["border"]["radius"].as<int>(10);
}

QString StyleConfig::backgroundColor() const
{
    return stringAt(root_["colors"]["background"], "#1A1A1AFF");
}

QString StyleConfig::textColor() const
{
    return stringAt(root_["colors"]["text"], "#FFFFFFFF");
}

QString StyleConfig::borderColor() const
{
    return stringAt(root_["colors"]["border"], "#FFFFFFFF");
}

bool StyleConfig::stackEnabled() const
{
    return root_["stack"]["enabled"].as<bool>(true);
}

int StyleConfig::stackGap() const
{
    return root_["stack"]["gap"].as<int>(10);
}

int StyleConfig::defaultOffset() const
{
    return root_["stack"]["default_offset"].as<int>(20);
}

int StyleConfig::edgeMargin() const
{
    return root_["stack"]["edge_margin"].as<int>(20);
}

QString StyleConfig::textAntialias() const
{
    return stringAt(root_["text"]["antialias"], "default");
}

QString StyleConfig::textHint() const
{
    return stringAt(root_["text"]["hint"], "default");
}

QString StyleConfig::stateDir() const
{
    return stringAt(root_["state_dir"], "");
}

// --- Validation ---

bool StyleConfig::applyTo(PopupOptions& options, QString* error) const
{
    auto reject = [error](const QString& message) {
        if (error)
            *error = message;
        return false;
    };

    PopupOptions result = options;

    // Typed reads with a fallback never throw, so check the scalars here.
    struct IntKey {
        const char* path;
        YAML::Node node;
        int minimum;
        int* target;
    };
    const IntKey intKeys[] = {
        {"width", root_["width"], 1, &result.style.width},
        {"padding", root_["padding"], 0, &result.style.padding},
        {"border.size", root_["border"]["size"], 0, &result.style.borderSize},
        {"border.radius", root_["border"]["radius"], 0, &result.style.borderRadius},
        {"stack.gap", root_["stack"]["gap"], 0, &result.stackGap},
        {"stack.default_offset", root_["stack"]["default_offset"], 0, &result.defaultOffset},
        {"stack.edge_margin", root_["stack"]["edge_margin"], 0, &result.edgeMargin},
    };
    for (const auto& key : intKeys) {
        int value = 0;
        if (!YAML::convert<int>::decode(key.node, value) || value < key.minimum)
            return reject(QStringLiteral("style: '%1' must be an integer >= %2")
                              .arg(QLatin1String(key.path)).arg(key.minimum));
        *key.target = value;
    }

    qint64 timeout = 0;
    if (!YAML::convert<qint64>::decode(root_["timeout_ms"], timeout) || timeout < 0 || timeout > INT_MAX)
        return reject(QStringLiteral("style: 'timeout_ms' must be an integer in 0..%1").arg(INT_MAX));
    result.timeoutMs = timeout;

    bool stack = true;
    if (!YAML::convert<bool>::decode(root_["stack"]["enabled"], stack))
        return reject(QStringLiteral("style: 'stack.enabled' must be true or false"));
    result.stack = stack;

    if (!edgeFromName(position(), &result.edge))
        return reject(QStringLiteral("style: unknown position '%1'").arg(position()));

    struct ColorKey {
        const char* path;
        QString value;
        QColor* target;
    };
    const ColorKey colorKeys[] = {
        {"colors.background", backgroundColor(), &result.style.background},
        {"colors.text", textColor(), &result.style.text},
        {"colors.border", borderColor(), &result.style.border},
    };
    for (const auto& key : colorKeys) {
        if (!parseHexColor(key.value, key.target))
            return reject(QStringLiteral("style: '%1' is not a #RRGGBB[AA] color: %2")
                              .arg(QLatin1String(key.path), key.value));
    }

    if (!textAntialiasFromName(textAntialias(), &result.style.antialias))
        return reject(QStringLiteral("style: unknown text.antialias '%1'").arg(textAntialias()));
    if (!textHintFromName(textHint(), &result.style.hint))
        return reject(QStringLiteral("style: unknown text.hint '%1'").arg(textHint()));

    if (font().trimmed().isEmpty())
        return reject(QStringLiteral("style: 'font' must not be empty"));
    result.style.font = font();
    result.stateDir = stateDir();

    options = result;
    return true;
}

// --- Locations ---

QString StyleConfig::configHome()
{
    const QString home = qEnvironmentVariable("XDG_CONFIG_HOME");
    if (!home.isEmpty())
        return home;
    return QDir::homePath() + "/.config";
}

QString StyleConfig::resolvePath(const QString& style, const QString& configHome)
{
    if (style.contains(QLatin1Char('/')))
        return style;
    const QString name = style.isEmpty() ? QStringLiteral("config") : style;
    return QDir(configHome).filePath(QStringLiteral("creak/%1.yaml").arg(name));
}

} // namespace creak
