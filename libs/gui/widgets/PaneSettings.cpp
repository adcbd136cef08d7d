#include "PaneSettings.hpp"
#include "DockKitLogging.hpp"
#include <QSettings>
#include <cmath>

namespace {
const char* kGroup = "panes";
const char* kContentSizeKey = "defaultContentSize";
const char* kCloseShortcutKey = "closeShortcut";

bool isValidContentSize(double size) {
    return std::isfinite(size) && size > 0.0;
}
}

double PaneSettings::defaultContentSize() {
    QSettings settings;
    settings.beginGroup(kGroup);
    bool ok = false;
    const double stored = settings.value(kContentSizeKey, DEFAULT_CONTENT_SIZE).toDouble(&ok);
    settings.endGroup();

    if (!ok || !isValidContentSize(stored)) {
        qCWarning(logApp) << "Invalid stored default content size" << stored
                          << "- using" << DEFAULT_CONTENT_SIZE;
        return DEFAULT_CONTENT_SIZE;
    }
    return stored;
}

bool PaneSettings::setDefaultContentSize(double size) {
    if (!isValidContentSize(size)) return false;

    QSettings settings;
    settings.beginGroup(kGroup);
    settings.setValue(kContentSizeKey, size);
    settings.endGroup();
    settings.sync();
    return true;
}

QKeySequence PaneSettings::closeShortcut() {
    QSettings settings;
    settings.beginGroup(kGroup);
    const QString stored = settings.value(kCloseShortcutKey).toString();
    settings.endGroup();

    if (stored.isEmpty()) {
        return QKeySequence(QKeySequence::Close);
    }
    return QKeySequence::fromString(stored, QKeySequence::PortableText);
}

void PaneSettings::setCloseShortcut(const QKeySequence& shortcut) {
    QSettings settings;
    settings.beginGroup(kGroup);
    settings.setValue(kCloseShortcutKey, shortcut.toString(QKeySequence::PortableText));
    settings.endGroup();
    settings.sync();
}

void PaneSettings::reset() {
    QSettings settings;
    settings.remove(kGroup);
    settings.sync();
}
