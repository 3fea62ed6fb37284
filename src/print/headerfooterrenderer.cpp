#include "headerfooterrenderer.h"
#include "pagecanvas.h"
#include "pagelayout.h"
#include "theme.h"

#include <QLocale>
#include <QRegularExpression>

namespace HeaderFooterRenderer {

void drawFooter(PageCanvas *canvas, const PageLayout &layout,
                const Report::Theme &theme, const PageMetadata &meta)
{
    const QString text = resolveField(layout.footerText, meta);
    if (text.isEmpty())
        return;

    canvas->setStyle(theme.style(Report::Roles::Footer));
    const qreal x = (layout.pageWidth() - canvas->textWidth(text)) / 2.0;
    canvas->drawText(x, layout.footerOffset, text);
}

void drawContinuationHeader(PageCanvas *canvas, const PageLayout &layout,
                            const PageMetadata &meta)
{
    // An untitled section leaves only the suffix, e.g. "(continued)"
    const QString text = resolveField(layout.continuationText, meta).trimmed();
    if (text.isEmpty())
        return;

    canvas->drawText(layout.margins.left(),
                     layout.pageHeight() - layout.continuationOffset, text);
}

QString resolveField(const QString &text, const PageMetadata &meta)
{
    if (text.isEmpty())
        return {};

    QString result = text;
    result.replace(QLatin1String("{page}"), QString::number(meta.pageNumber + 1));
    result.replace(QLatin1String("{pages}"),
                   meta.totalPages > 0 ? QString::number(meta.totalPages)
                                       : QStringLiteral("?"));
    result.replace(QLatin1String("{date}"),
                   QLocale().toString(meta.date, QLocale::ShortFormat));

    // Custom date format: {date:yyyy-MM-dd}
    static const QRegularExpression dateRx(
        QStringLiteral(R"(\{date:([^}]+)\})"));
    QRegularExpressionMatch match = dateRx.match(result);
    while (match.hasMatch()) {
        result.replace(match.captured(0), meta.date.toString(match.captured(1)));
        match = dateRx.match(result);
    }

    // Titles last and in a single pass, so braces inside them are left alone
    static const QRegularExpression titleRx(QStringLiteral(R"(\{(title|section)\})"));
    QString resolved;
    qsizetype last = 0;
    QRegularExpressionMatchIterator it = titleRx.globalMatch(result);
    while (it.hasNext()) {
        const QRegularExpressionMatch m = it.next();
        resolved += QStringView(result).mid(last, m.capturedStart() - last);
        resolved += m.captured(1) == QLatin1String("title") ? meta.title : meta.section;
        last = m.capturedEnd();
    }
    resolved += QStringView(result).mid(last);
    return resolved;
}

bool needsTotalPages(const QString &text)
{
    return text.contains(QLatin1String("{pages}"));
}

} // namespace HeaderFooterRenderer
