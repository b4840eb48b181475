#include "core/CommandLine.hpp"
#include "core/StyleConfig.hpp"
#include <QFileInfo>
#include <climits>

namespace creak {

namespace {

const char* const EDGE_OPTIONS[] = {
    "top-left", "top", "top-right",
    "left", "center", "right",
    "bottom-left", "bottom", "bottom-right",
};

const struct {
    const char* name;
    const char* target;
    Edge edge;
} EDGE_ALIASES[] = {
    {"top-center", "top", Edge::Top},
    {"bottom-center", "bottom", Edge::Bottom},
};

bool edgeFromOption(const QString& name, Edge* edge)
{
    for (const auto& alias : EDGE_ALIASES) {
        if (name == QLatin1String(alias.name)) {
            *edge = alias.edge;
            return true;
        }
    }
    return edgeFromName(name, edge);
}

const char* const USAGE =
    "Usage:\n"
    "  creak [options] <title> [body...]\n"
    "  creak list active [--style <name|path>] [--state-dir <path>]\n"
    "  creak clear by name|class|id <value> [--style <name|path>] [--state-dir <path>]\n";

bool toInt(const QString& text, int minimum, int* value)
{
    bool ok = false;
    const int v = text.toInt(&ok);
    if (!ok || v < minimum)
        return false;
    *value = v;
    return true;
}

} // namespace

CommandLine::CommandLine(const QString& configHome)
    : configHome_(configHome)
{
    parser_.setApplicationDescription(
        QStringLiteral("Show a popup notification, or list and clear active ones."));

    parser_.addOptions({
        {{"h", "help"}, "Show this help."},
        {"style", "Style name (looked up in the config directory) or path.", "name|path"},
        {"state-dir", "Directory holding the active notification records.", "path"},
        {"name", "Tag the notification with a name.", "name"},
        {"class", "Tag the notification with a class.", "class"},
        {"timeout", "Milliseconds before the popup closes, 0 to keep it.", "ms"},
        {"width", "Minimum popup width.", "px"},
        {"font", "Font as \"Family Size\".", "desc"},
        {"padding", "Space between border and text.", "px"},
        {"border-size", "Border width.", "px"},
        {"border-radius", "Corner radius.", "px"},
        {"background", "Background color.", "#RRGGBB[AA]"},
        {"text", "Text color.", "#RRGGBB[AA]"},
        {"border", "Border color.", "#RRGGBB[AA]"},
        {"edge", "Distance from the screen's side edges.", "px"},
        {"default-offset", "Distance of the first popup from its edge.", "px"},
        {"stack-gap", "Space between stacked popups.", "px"},
        {"stack", "Stack below other popups on the same edge."},
        {"no-stack", "Ignore other popups when placing this one."},
        {"text-antialias", "default, none, gray or subpixel.", "mode"},
        {"text-hint", "default, none, slight, medium or full.", "style"},
        {"list-active", "Same as 'list active'."},
        {"clear-by-name", "Same as 'clear by name <name>'.", "name"},
        {"clear-by-class", "Same as 'clear by class <class>'.", "class"},
        {"clear-by-id", "Same as 'clear by id <id>'.", "id"},
    });
    for (const char* edge : EDGE_OPTIONS)
        parser_.addOption({QString::fromLatin1(edge),
                           QStringLiteral("Place the popup at %1.").arg(QLatin1String(edge))});
    for (const auto& alias : EDGE_ALIASES)
        parser_.addOption({QString::fromLatin1(alias.name),
                           QStringLiteral("Same as --%1.").arg(QLatin1String(alias.target))});

    parser_.addPositionalArgument("title", "First line of the popup.");
    parser_.addPositionalArgument("body", "Further words, joined on the second line.", "[body...]");
}

bool CommandLine::fail(const QString& message)
{
    errorString_ = message;
    return false;
}

QString CommandLine::helpText() const
{
    return QString::fromLatin1(USAGE) + QLatin1Char('\n') + parser_.helpText();
}

bool CommandLine::parse(const QStringList& arguments)
{
    invocation_ = Invocation();
    errorString_.clear();

    if (!parser_.parse(arguments))
        return fail(parser_.errorText());

    if (parser_.isSet("help")) {
        invocation_.command = Invocation::Command::Help;
        return true;
    }

    if (!applyStyle(parser_.value("style"), parser_.isSet("style")))
        return false;
    if (!applyOverrides())
        return false;
    return parseCommand(parser_.positionalArguments());
}

bool CommandLine::applyStyle(const QString& style, bool explicitStyle)
{
    const QString path = StyleConfig::resolvePath(style, configHome_);
    if (!QFileInfo::exists(path)) {
        // Only the default style file is optional.
        if (explicitStyle)
            return fail(QStringLiteral("style not found: %1").arg(path));
        return true;
    }

    StyleConfig config;
    QString error;
    if (!config.load(path, &error) || !config.applyTo(invocation_.options, &error))
        return fail(error);
    invocation_.stylePath = path;
    return true;
}

bool CommandLine::applyOverrides()
{
    PopupOptions& options = invocation_.options;

    const struct {
        const char* name;
        int minimum;
        int* target;
    } intOptions[] = {
        {"width", 1, &options.style.width},
        {"padding", 0, &options.style.padding},
        {"border-size", 0, &options.style.borderSize},
        {"border-radius", 0, &options.style.borderRadius},
        {"edge", 0, &options.edgeMargin},
        {"default-offset", 0, &options.defaultOffset},
        {"stack-gap", 0, &options.stackGap},
    };
    for (const auto& option : intOptions) {
        const QString name = QString::fromLatin1(option.name);
        if (parser_.isSet(name) && !toInt(parser_.value(name), option.minimum, option.target))
            return fail(QStringLiteral("invalid value for --%1: %2").arg(name, parser_.value(name)));
    }

    if (parser_.isSet("timeout")) {
        bool ok = false;
        const qint64 timeout = parser_.value("timeout").toLongLong(&ok);
        if (!ok || timeout < 0 || timeout > INT_MAX)
            return fail(QStringLiteral("invalid value for --timeout: %1").arg(parser_.value("timeout")));
        options.timeoutMs = timeout;
    }

    const struct {
        const char* name;
        QColor* target;
    } colorOptions[] = {
        {"background", &options.style.background},
        {"text", &options.style.text},
        {"border", &options.style.border},
    };
    for (const auto& option : colorOptions) {
        const QString name = QString::fromLatin1(option.name);
        if (parser_.isSet(name) && !parseHexColor(parser_.value(name), option.target))
            return fail(QStringLiteral("invalid color for --%1: %2").arg(name, parser_.value(name)));
    }

    if (parser_.isSet("font")) {
        if (parser_.value("font").trimmed().isEmpty())
            return fail(QStringLiteral("--font must not be empty"));
        options.style.font = parser_.value("font");
    }

    if (parser_.isSet("text-antialias")
        && !textAntialiasFromName(parser_.value("text-antialias"), &options.style.antialias))
        return fail(QStringLiteral("invalid value for --text-antialias: %1")
                        .arg(parser_.value("text-antialias")));
    if (parser_.isSet("text-hint")
        && !textHintFromName(parser_.value("text-hint"), &options.style.hint))
        return fail(QStringLiteral("invalid value for --text-hint: %1").arg(parser_.value("text-hint")));

    // For flags given more than once, the last one on the command line wins.
    for (const QString& name : parser_.optionNames()) {
        Edge edge;
        if (name == "stack")
            options.stack = true;
        else if (name == "no-stack")
            options.stack = false;
        else if (edgeFromOption(name, &edge))
            options.edge = edge;
    }

    if (parser_.isSet("name"))
        options.name = parser_.value("name");
    if (parser_.isSet("class"))
        options.className = parser_.value("class");
    if (parser_.isSet("state-dir"))
        options.stateDir = parser_.value("state-dir");
    return true;
}

bool CommandLine::parseCommand(const QStringList& positional)
{
    int controlCommands = 0;

    if (parser_.isSet("list-active")) {
        invocation_.command = Invocation::Command::ListActive;
        ++controlCommands;
    }

    const struct {
        const char* name;
        StateStore::Selector selector;
    } clearOptions[] = {
        {"clear-by-name", StateStore::Selector::Name},
        {"clear-by-class", StateStore::Selector::Class},
        {"clear-by-id", StateStore::Selector::Id},
    };
    for (const auto& option : clearOptions) {
        const QString name = QString::fromLatin1(option.name);
        if (parser_.isSet(name)) {
            invocation_.command = Invocation::Command::Clear;
            invocation_.clearBy = option.selector;
            invocation_.clearValue = parser_.value(name);
            ++controlCommands;
        }
    }

    const QString first = positional.value(0);
    if (first == "list") {
        if (positional.size() != 2 || positional.at(1) != "active")
            return fail(QStringLiteral("usage: creak list active"));
        invocation_.command = Invocation::Command::ListActive;
        ++controlCommands;
    } else if (first == "clear") {
        const QString usage = QStringLiteral("usage: creak clear by <name|class|id> <value>");
        if (positional.size() != 4 || positional.at(1) != "by")
            return fail(usage);

        const QString key = positional.at(2);
        if (key == "name")
            invocation_.clearBy = StateStore::Selector::Name;
        else if (key == "class")
            invocation_.clearBy = StateStore::Selector::Class;
        else if (key == "id")
            invocation_.clearBy = StateStore::Selector::Id;
        else
            return fail(usage);
        invocation_.command = Invocation::Command::Clear;
        invocation_.clearValue = positional.at(3);
        ++controlCommands;
    } else if (controlCommands > 0 && !positional.isEmpty()) {
        return fail(QStringLiteral("unexpected arguments for control command: %1")
                        .arg(positional.join(QLatin1Char(' '))));
    }

    if (controlCommands > 1)
        return fail(QStringLiteral("only one of list or clear may be given"));

    if (invocation_.command == Invocation::Command::Clear
        && invocation_.clearBy == StateStore::Selector::Id) {
        bool ok = false;
        const quint64 id = invocation_.clearValue.toULongLong(&ok);
        if (!ok || id == 0)
            return fail(QStringLiteral("invalid notification id: %1").arg(invocation_.clearValue));
    }

    if (controlCommands > 0)
        return true;

    if (positional.isEmpty())
        return fail(QStringLiteral("missing message"));

    invocation_.command = Invocation::Command::Show;
    QString message = positional.first();
    if (positional.size() > 1)
        message += QLatin1Char('\n') + positional.mid(1).join(QLatin1Char(' '));
    invocation_.options.message = message;
    return true;
}

} // namespace creak
