#pragma once

#include <QString>
#include <QStringList>
#include <yaml-cpp/yaml.h>

namespace creak {

struct PopupOptions;

/// Display defaults read from a YAML style file.
///
/// The file is deep-merged over a built-in defaults tree, so a style only
/// needs the keys it changes:
///
///   position: bottom-right
///   timeout_ms: 8000
///   colors:
///     background: "#202020E0"
///   stack:
///     gap: 6
///
/// Colors must be quoted, YAML reads an unquoted '#' as a comment.
class StyleConfig {
public:
    StyleConfig();

    /// Merges `filePath` over the defaults. On failure the defaults are kept.
    bool load(const QString& filePath, QString* error = nullptr);

    /// Keys present in the last loaded file that are not style keys.
    QStringList unknownKeys() const { return unknownKeys_; }

    QString position() const;
    qint64 timeoutMs() const;
    int width() const;
    QString font() const;
    int padding() const;
    int borderSize() const;
    int borderRadius() const;
    QString backgroundColor() const;
    QString textColor() const;
    QString borderColor() const;
    bool stackEnabled() const;
    int stackGap() const;
    int defaultOffset() const;
    int edgeMargin() const;
    QString textAntialias() const;
    QString textHint() const;
    QString stateDir() const;

    /// Validates every value and writes it into `options`. `options` is left
    /// untouched when a value is invalid.
    bool applyTo(PopupOptions& options, QString* error = nullptr) const;

    /// $XDG_CONFIG_HOME, or ~/.config.
    static QString configHome();

    /// `style` containing '/' is a path; otherwise `<configHome>/creak/<style>.yaml`.
    /// An empty `style` names the default style file.
    static QString resolvePath(const QString& style, const QString& configHome);

private:
    YAML::Node root_;
    QStringList unknownKeys_;

    void initDefaults();
};

} // namespace creak
