/*
 * pdfwriter.h — Low-level PDF writer
 *
 * Objects are numbered up front (reserveObjects) and written in any
 * order; the cross-reference table is produced at the end.  File output
 * goes through QSaveFile, so an aborted or failed document never
 * replaces or leaves behind a file at the target path.
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#ifndef REPORTFLOW_PDFWRITER_H
#define REPORTFLOW_PDFWRITER_H

#include <cstdint>
#include <type_traits>

#include <QByteArray>
#include <QDateTime>
#include <QHash>
#include <QList>
#include <QSaveFile>
#include <QString>

#include <memory>

namespace Pdf {

using ObjId = uint32_t;

// --- PDF serialization helpers (cf. PDF32000-2008) ---

bool isDelimiter(char c);

QByteArray toUTF16(const QString &s);

template <typename T, std::enable_if_t<std::is_integral_v<T> || std::is_enum_v<T>, bool> = true>
inline QByteArray toPdf(T v) { return QByteArray::number(static_cast<qlonglong>(v)); }

template <typename T, std::enable_if_t<std::is_floating_point_v<T>, bool> = true>
inline QByteArray toPdf(T v) { return QByteArray::number(v, 'f', 2); }

QByteArray toObjRef(ObjId id);

QByteArray toLiteralString(const QByteArray &s);
QByteArray toHexString(const QByteArray &s);
QByteArray toName(const QByteArray &s);
QByteArray toDateString(const QDateTime &dt);

// --- Resource dictionary ---

struct ResourceDict {
    QHash<QByteArray, ObjId> fonts;
    QHash<QByteArray, ObjId> xObjects;
};

// --- PDF Writer ---

class Writer {
public:
    Writer();
    ~Writer();

    Writer(const Writer &) = delete;
    Writer &operator=(const Writer &) = delete;

    // Output targets (mutually exclusive)
    bool openFile(const QString &filename);
    bool openBuffer(QByteArray *buffer);

    // Finishes the output.  With aborted = true, or after any write error,
    // the target file is left untouched and the buffer is cleared.
    bool close(bool aborted = false);

    bool isOpen() const { return m_open; }
    bool hasError() const { return !m_errorString.isEmpty(); }
    QString errorString() const { return m_errorString; }

    // PDF structure
    void writeHeader();
    void writeXrefAndTrailer();
    void write(const QByteArray &bytes);
    void writeResourceDict(const ResourceDict &dict);

    // Object management
    ObjId reserveObjects(unsigned int n);
    ObjId newObject() { return reserveObjects(1); }
    void startObj(ObjId id);
    ObjId startObj();
    void endObj(ObjId id);
    void endObjectWithStream(ObjId id, const QByteArray &streamContent,
                             bool compress = true);

    // Well-known object IDs (assigned when the output is opened)
    ObjId catalogObj() const { return m_catalogObj; }
    ObjId infoObj() const { return m_infoObj; }
    ObjId pagesObj() const { return m_pagesObj; }

private:
    void reset();
    void writeRaw(const QByteArray &bytes);
    void setError(const QString &message);

    ObjId m_objCounter = 0;
    ObjId m_currentObj = 0;

    // Output: either file or buffer
    std::unique_ptr<QSaveFile> m_file;
    QByteArray *m_buffer = nullptr;
    bool m_open = false;

    QList<qint64> m_xref;
    qint64 m_bytesWritten = 0;
    QString m_errorString;

    // Well-known objects
    ObjId m_catalogObj = 0;
    ObjId m_infoObj = 0;
    ObjId m_pagesObj = 0;

    QByteArray m_fileId;
};

} // namespace Pdf

#endif // REPORTFLOW_PDFWRITER_H
