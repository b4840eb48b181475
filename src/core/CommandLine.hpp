#pragma once

#include "core/PopupOptions.hpp"
#include "core/state/StateStore.hpp"
#include <QCommandLineParser>
#include <QString>
#include <QStringList>

namespace creak {

/// What one `creak` invocation asks for.
struct Invocation {
    enum class Command {
        Help,
        Show,
        ListActive,
        Clear
    };

    Command command = Command::Show;
    StateStore::Selector clearBy = StateStore::Selector::Name;
    QString clearValue;

    /// Defaults, then the style file, then command-line options.
    PopupOptions options;
    QString stylePath;     // style file that was applied, empty if none
};

/// Parses argv into an Invocation.
///
///   creak list active
///   creak clear by name|class|id <value>
///   creak [options] <title> [body...]
///
/// `--list-active` and `--clear-by-name|class|id <value>` are accepted as
/// aliases for the positional forms.
class CommandLine {
public:
    /// `configHome` is where named styles are looked up.
    explicit CommandLine(const QString& configHome);

    /// `arguments` includes the program name. Returns false on a usage or
    /// style error; see errorString().
    bool parse(const QStringList& arguments);

    const Invocation& invocation() const { return invocation_; }
    QString errorString() const { return errorString_; }

    QString helpText() const;

private:
    bool fail(const QString& message);
    bool applyStyle(const QString& style, bool explicitStyle);
    bool applyOverrides();
    bool parseCommand(const QStringList& positional);

    QCommandLineParser parser_;
    QString configHome_;
    Invocation invocation_;
    QString errorString_;
};

} // namespace creak
