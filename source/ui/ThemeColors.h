#ifndef THEMECOLORS_H
#define THEMECOLORS_H

#include <QColor>
#include <QPalette>

/**
 * @brief Unified color palette for the ProofBoard light and dark themes.
 *
 * All widgets take their colors from here instead of hardcoding values, so
 * toggling dark mode only has to re-query these helpers.
 */
namespace ThemeColors {

// ============================================================================
// Base Gray Palette
// ============================================================================

// Dark mode grays (slate-tinted)
inline QColor darkPrimary()     { return QColor(0x0f, 0x17, 0x2a); }  // #0f172a - window
inline QColor darkSecondary()   { return QColor(0x1e, 0x29, 0x3b); }  // #1e293b - panels
inline QColor darkTertiary()    { return QColor(0x33, 0x41, 0x55); }  // #334155 - borders

// Light mode grays
inline QColor lightPrimary()    { return QColor(0xF8, 0xFA, 0xFC); }  // #F8FAFC - window
inline QColor lightSecondary()  { return QColor(0xFF, 0xFF, 0xFF); }  // #FFFFFF - panels
inline QColor lightTertiary()   { return QColor(0xE2, 0xE8, 0xF0); }  // #E2E8F0 - borders

// ============================================================================
// Convenience Functions (select by dark mode)
// ============================================================================

inline QColor window(bool dark)         { return dark ? darkPrimary() : lightPrimary(); }
inline QColor panel(bool dark)          { return dark ? darkSecondary() : lightSecondary(); }
inline QColor border(bool dark)         { return dark ? darkTertiary() : lightTertiary(); }

// The drawing surface is white in both themes
inline QColor canvasBackground()        { return QColor(Qt::white); }
inline QColor canvasHint()              { return QColor(148, 163, 184); }

// ============================================================================
// Text Colors
// ============================================================================

inline QColor textPrimary(bool dark)    { return dark ? QColor(241, 245, 249) : QColor(30, 41, 59); }
inline QColor textSecondary(bool dark)  { return dark ? QColor(148, 163, 184) : QColor(100, 116, 139); }

// ============================================================================
// Accent Colors
// ============================================================================

// Armed template token
inline QColor armedFill(bool dark)      { return dark ? QColor(30, 58, 138) : QColor(219, 234, 254); }
inline QColor armedBorder(bool dark)    { return dark ? QColor(96, 165, 250) : QColor(59, 130, 246); }
inline QColor armedText(bool dark)      { return dark ? QColor(219, 234, 254) : QColor(29, 78, 216); }

// Selected annotation edit box
inline QColor editPanel(bool dark)      { return dark ? QColor(69, 52, 16) : QColor(255, 251, 235); }
inline QColor editBorder(bool dark)     { return dark ? QColor(180, 130, 30) : QColor(252, 211, 77); }

inline QColor danger()                  { return QColor(239, 68, 68); }

// ============================================================================
// Application Palette
// ============================================================================

/**
 * @brief Full QPalette for the chosen theme (applied with QApplication::setPalette).
 */
inline QPalette applicationPalette(bool dark)
{
    QPalette pal;
    const QColor gray(128, 128, 128);
    const QColor blue(59, 130, 246);

    pal.setColor(QPalette::Window, window(dark));
    pal.setColor(QPalette::WindowText, textPrimary(dark));
    pal.setColor(QPalette::Base, panel(dark));
    pal.setColor(QPalette::AlternateBase, window(dark));
    pal.setColor(QPalette::Text, textPrimary(dark));
    pal.setColor(QPalette::ToolTipBase, panel(dark));
    pal.setColor(QPalette::ToolTipText, textPrimary(dark));
    pal.setColor(QPalette::Button, dark ? darkTertiary() : QColor(241, 245, 249));
    pal.setColor(QPalette::ButtonText, textPrimary(dark));
    pal.setColor(QPalette::BrightText, Qt::red);
    pal.setColor(QPalette::Link, blue);
    pal.setColor(QPalette::Highlight, blue);
    pal.setColor(QPalette::HighlightedText, Qt::white);
    pal.setColor(QPalette::PlaceholderText, gray);

    pal.setColor(QPalette::Disabled, QPalette::WindowText, gray);
    pal.setColor(QPalette::Disabled, QPalette::Text, gray);
    pal.setColor(QPalette::Disabled, QPalette::ButtonText, gray);
    return pal;
}

} // namespace ThemeColors

#endif // THEMECOLORS_H
