/*
 * standardfonts.cpp — PDF base-14 fonts: names, WinAnsi encoding, metrics
 *
 * Advance widths are the Adobe AFM values (1/1000 em) for the printable
 * ASCII range.  Accented letters take the width of their base letter, which
 * is what the AFM files list for them.  The remaining WinAnsi glyphs
 * (ligatures such as AE, eszett, currency and fraction signs) use a few
 * representative widths, so lines containing them may be placed a little
 * off when centred or right-aligned.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "standardfonts.h"

#include <QDebug>
#include <QHash>

namespace StandardFonts {

namespace {

constexpr int kFirstGlyph = 32;
constexpr int kGlyphCount = 95; // 32..126
constexpr quint16 kCourierWidth = 600;

const quint16 kHelvetica[kGlyphCount] = {
     278,  278,  355,  556,  556,  889,  667,  191,  333,  333,  389,  584,  278,  333,  278,  278,
     556,  556,  556,  556,  556,  556,  556,  556,  556,  556,  278,  278,  584,  584,  584,  556,
    1015,  667,  667,  722,  722,  667,  611,  778,  722,  278,  500,  667,  556,  833,  722,  778,
     667,  778,  722,  667,  611,  722,  667,  944,  667,  667,  611,  278,  278,  278,  469,  556,
     333,  556,  556,  500,  556,  556,  278,  556,  556,  222,  222,  500,  222,  833,  556,  556,
     556,  556,  333,  500,  278,  556,  500,  722,  500,  500,  500,  333,  260,  333,  584,
};

const quint16 kHelveticaBold[kGlyphCount] = {
     278,  333,  474,  556,  556,  889,  722,  238,  333,  333,  389,  584,  278,  333,  278,  278,
     556,  556,  556,  556,  556,  556,  556,  556,  556,  556,  333,  333,  584,  584,  584,  611,
     975,  722,  722,  722,  722,  667,  611,  778,  722,  278,  556,  722,  611,  833,  722,  778,
     667,  778,  722,  667,  611,  722,  667,  944,  667,  667,  611,  333,  278,  333,  584,  556,
     333,  556,  611,  556,  611,  556,  333,  611,  611,  278,  278,  556,  278,  889,  611,  611,
     611,  611,  389,  556,  333,  611,  556,  778,  556,  556,  500,  389,  280,  389,  584,
};

const quint16 kTimesRoman[kGlyphCount] = {
     250,  333,  408,  500,  500,  833,  778,  180,  333,  333,  500,  564,  250,  333,  250,  278,
     500,  500,  500,  500,  500,  500,  500,  500,  500,  500,  278,  278,  564,  564,  564,  444,
     921,  722,  667,  667,  722,  611,  556,  722,  722,  333,  389,  722,  611,  889,  722,  722,
     556,  722,  667,  556,  611,  722,  722,  944,  722,  722,  611,  333,  278,  333,  469,  500,
     333,  444,  500,  444,  500,  444,  333,  500,  500,  278,  278,  500,  278,  778,  500,  500,
     500,  500,  333,  389,  278,  500,  500,  722,  500,  500,  444,  480,  200,  480,  541,
};

const quint16 kTimesBold[kGlyphCount] = {
     250,  333,  555,  500,  500, 1000,  833,  278,  333,  333,  500,  570,  250,  333,  250,  278,
     500,  500,  500,  500,  500,  500,  500,  500,  500,  500,  333,  333,  570,  570,  570,  500,
     930,  722,  667,  722,  722,  667,  611,  778,  778,  389,  500,  778,  667,  944,  722,  778,
     611,  778,  722,  556,  667,  722,  722, 1000,  722,  722,  667,  333,  278,  333,  581,  500,
     333,  500,  556,  444,  556,  444,  333,  500,  556,  278,  333,  556,  278,  833,  556,  500,
     556,  556,  444,  389,  333,  556,  500,  722,  500,  500,  444,  394,  220,  394,  520,
};

const quint16 kTimesItalic[kGlyphCount] = {
     250,  333,  420,  500,  500,  833,  778,  214,  333,  333,  500,  675,  250,  333,  250,  278,
     500,  500,  500,  500,  500,  500,  500,  500,  500,  500,  333,  333,  675,  675,  675,  500,
     920,  611,  611,  667,  722,  611,  611,  722,  722,  333,  444,  667,  556,  833,  667,  722,
     611,  722,  611,  500,  556,  722,  611,  833,  611,  556,  556,  389,  278,  389,  422,  500,
     333,  500,  500,  444,  500,  444,  278,  500,  500,  278,  278,  444,  278,  722,  500,  500,
     500,  500,  389,  389,  278,  500,  444,  667,  444,  444,  389,  400,  275,  400,  541,
};

const quint16 kTimesBoldItalic[kGlyphCount] = {
     250,  389,  555,  500,  500,  833,  778,  278,  333,  333,  500,  570,  250,  333,  250,  278,
     500,  500,  500,  500,  500,  500,  500,  500,  500,  500,  333,  333,  570,  570,  570,  500,
     832,  667,  667,  667,  722,  667,  667,  722,  778,  389,  500,  667,  611,  889,  722,  722,
     611,  722,  667,  556,  611,  722,  667,  889,  667,  611,  611,  333,  278,  333,  570,  500,
     333,  500,  500,  444,  500,  444,  333,  500,  556,  278,  278,  500,  278,  778,  556,  500,
     500,  500,  389,  389,  278,  556,  444,  667,  500,  444,  389,  348,  220,  348,  570,
};

struct FontEntry {
    const char *name;
    const quint16 *widths; // nullptr = fixed pitch (Courier)
};

const FontEntry kFonts[] = {
    {"Helvetica",             kHelvetica},
    {"Helvetica-Oblique",     kHelvetica},
    {"Helvetica-Bold",        kHelveticaBold},
    {"Helvetica-BoldOblique", kHelveticaBold},
    {"Times-Roman",           kTimesRoman},
    {"Times-Bold",            kTimesBold},
    {"Times-Italic",          kTimesItalic},
    {"Times-BoldItalic",      kTimesBoldItalic},
    {"Courier",               nullptr},
    {"Courier-Oblique",       nullptr},
    {"Courier-Bold",          nullptr},
    {"Courier-BoldOblique",   nullptr},
};

const FontEntry *findFont(const QString &name)
{
    for (const FontEntry &entry : kFonts) {
        if (name == QLatin1String(entry.name))
            return &entry;
    }
    return nullptr;
}

quint16 asciiWidth(const FontEntry &font, char c)
{
    if (!font.widths)
        return kCourierWidth;
    return font.widths[static_cast<uchar>(c) - kFirstGlyph];
}

// Width of one WinAnsi byte in 1/1000 em
quint16 charWidth(const FontEntry &font, uchar code)
{
    if (!font.widths)
        return kCourierWidth;
    if (code >= kFirstGlyph && code < kFirstGlyph + kGlyphCount)
        return font.widths[code - kFirstGlyph];

    switch (code) {
    case 0x95: return 350;                     // bullet
    case 0x96: return asciiWidth(font, '0');   // en dash, figure width
    case 0x85:                                 // ellipsis
    case 0x97: return 1000;                    // em dash
    case 0x91: case 0x92:                      // single quotes
    case 0x82: return asciiWidth(font, ',');
    case 0x93: case 0x94:                      // double quotes
    case 0x84: return asciiWidth(font, '"');
    case 0xa0: return asciiWidth(font, ' ');   // no-break space
    case 0xb0: return 400;                     // degree
    default:   return asciiWidth(font, 'n');
    }
}

uchar winAnsiCode(QChar ch)
{
    ushort u = ch.unicode();
    if ((u >= 0x20 && u < 0x7f) || (u >= 0xa0 && u <= 0xff))
        return static_cast<uchar>(u);

    static const QHash<ushort, uchar> extras = {
        {0x20ac, 0x80}, {0x201a, 0x82}, {0x0192, 0x83}, {0x201e, 0x84},
        {0x2026, 0x85}, {0x2020, 0x86}, {0x2021, 0x87}, {0x02c6, 0x88},
        {0x2030, 0x89}, {0x0160, 0x8a}, {0x2039, 0x8b}, {0x0152, 0x8c},
        {0x017d, 0x8e}, {0x2018, 0x91}, {0x2019, 0x92}, {0x201c, 0x93},
        {0x201d, 0x94}, {0x2022, 0x95}, {0x2013, 0x96}, {0x2014, 0x97},
        {0x02dc, 0x98}, {0x2122, 0x99}, {0x0161, 0x9a}, {0x203a, 0x9b},
        {0x0153, 0x9c}, {0x017e, 0x9e}, {0x0178, 0x9f},
    };
    return extras.value(u, '?');
}

} // namespace

QStringList fontNames()
{
    QStringList names;
    for (const FontEntry &entry : kFonts)
        names.append(QLatin1String(entry.name));
    return names;
}

bool isStandardFont(const QString &name)
{
    return findFont(name) != nullptr;
}

QString resolve(const QString &name)
{
    if (isStandardFont(name))
        return name;
    qWarning() << "StandardFonts: unknown font" << name << "- using Helvetica";
    return QStringLiteral("Helvetica");
}

qreal textWidth(const QString &fontName, qreal fontSize, const QString &text)
{
    const FontEntry *font = findFont(fontName);
    if (!font)
        font = &kFonts[0];

    qint64 units = 0;
    for (QChar ch : text) {
        const uchar code = winAnsiCode(ch);
        if (code >= 0x80 && ch.decompositionTag() == QChar::Canonical) {
            const QChar base = ch.decomposition().at(0);
            if (base.unicode() >= kFirstGlyph && base.unicode() < kFirstGlyph + kGlyphCount) {
                units += asciiWidth(*font, static_cast<char>(base.unicode()));
                continue;
            }
        }
        units += charWidth(*font, code);
    }
    return units * fontSize / 1000.0;
}

QByteArray toWinAnsi(const QString &text)
{
    QByteArray result;
    result.reserve(text.size());
    for (QChar ch : text)
        result.append(static_cast<char>(winAnsiCode(ch)));
    return result;
}

} // namespace StandardFonts
