/*
 * pdfwriter.cpp — Low-level PDF writer
 *
 * SPDX-License-Identifier: GPL-2.0-or-later
 */

#include "pdfwriter.h"

#include <QCryptographicHash>
#include <QDebug>
#include <zlib.h>

namespace Pdf {

namespace {
constexpr char kHexDigits[] = "0123456789ABCDEF";
constexpr ObjId kFirstFreeObj = 4; // 1=catalog, 2=info, 3=pages
}

bool isDelimiter(char c)
{
    return QByteArray("()<>[]{}/%").contains(c);
}

// UTF-16BE with byte order mark, for text strings outside content streams
QByteArray toUTF16(const QString &s)
{
    QByteArray result;
    result.reserve(2 + s.length() * 2);
    result.append('\xfe');
    result.append('\xff');
    for (int i = 0; i < s.length(); ++i) {
        result.append(static_cast<char>(s[i].row()));
        result.append(static_cast<char>(s[i].cell()));
    }
    return result;
}

QByteArray toObjRef(ObjId id)
{
    return toPdf(id) + " 0 R";
}

QByteArray toLiteralString(const QByteArray &s)
{
    constexpr int lineLength = 80;
    QByteArray result("(");
    for (int i = 0; i < s.length(); ++i) {
        uchar v = s[i];
        if (v == '(' || v == ')' || v == '\\') {
            result.append('\\');
            result.append(static_cast<char>(v));
        } else if (v < 32 || v >= 127) {
            result.append('\\');
            result.append("01234567"[(v / 64) % 8]);
            result.append("01234567"[(v / 8) % 8]);
            result.append("01234567"[v % 8]);
        } else {
            result.append(static_cast<char>(v));
        }
        if (i % lineLength == lineLength - 1)
            result.append("\\\n");
    }
    result.append(')');
    return result;
}

QByteArray toHexString(const QByteArray &s)
{
    constexpr int lineLength = 80;
    QByteArray result("<");
    for (int i = 0; i < s.length(); ++i) {
        uchar v = s[i];
        result.append(kHexDigits[v / 16]);
        result.append(kHexDigits[v % 16]);
        if (i % lineLength == lineLength - 1)
            result.append('\n');
    }
    result.append('>');
    return result;
}

QByteArray toName(const QByteArray &s)
{
    QByteArray result("/");
    for (int i = 0; i < s.length(); ++i) {
        uchar c = s[i];
        if (c <= 32 || c >= 127 || c == '#' || isDelimiter(static_cast<char>(c))) {
            result.append('#');
            result.append(kHexDigits[c / 16]);
            result.append(kHexDigits[c % 16]);
        } else {
            result.append(static_cast<char>(c));
        }
    }
    return result;
}

QByteArray toDateString(const QDateTime &dt)
{
    return "D:" + dt.toUTC().toString(QStringLiteral("yyyyMMddHHmmss")).toLatin1() + "Z";
}

// --- Writer implementation ---

Writer::Writer()
{
    m_fileId = QCryptographicHash::hash(
        QDateTime::currentDateTime().toString(Qt::ISODateWithMs).toUtf8(),
        QCryptographicHash::Md5);
}

Writer::~Writer()
{
    if (m_open)
        close(true);
}

void Writer::reset()
{
    m_bytesWritten = 0;
    m_objCounter = kFirstFreeObj;
    m_currentObj = 0;
    m_catalogObj = 1;
    m_infoObj = 2;
    m_pagesObj = 3;
    m_xref.clear();
    m_errorString.clear();
}

bool Writer::openFile(const QString &filename)
{
    if (m_open) {
        setError(QStringLiteral("writer is already open"));
        return false;
    }
    reset();
    m_buffer = nullptr;
    m_file = std::make_unique<QSaveFile>(filename);
    if (!m_file->open(QIODevice::WriteOnly)) {
        setError(QStringLiteral("cannot open %1 for writing: %2")
                     .arg(filename, m_file->errorString()));
        m_file.reset();
        return false;
    }
    m_open = true;
    return true;
}

bool Writer::openBuffer(QByteArray *buffer)
{
    if (!buffer || m_open)
        return false;
    reset();
    m_file.reset();
    m_buffer = buffer;
    m_buffer->clear();
    m_open = true;
    return true;
}

bool Writer::close(bool aborted)
{
    if (!m_open)
        return false;
    m_open = false;

    const bool ok = !aborted && !hasError();
    if (m_buffer) {
        if (!ok)
            m_buffer->clear();
        m_buffer = nullptr;
        return ok;
    }

    // QSaveFile only replaces the target on a successful commit
    bool committed = false;
    if (ok) {
        committed = m_file->commit();
        if (!committed)
            setError(QStringLiteral("cannot write %1: %2")
                         .arg(m_file->fileName(), m_file->errorString()));
    } else {
        m_file->cancelWriting();
    }
    m_file.reset(); // an uncommitted QSaveFile discards its temporary file
    return committed;
}

void Writer::setError(const QString &message)
{
    // Keep the first failure; later ones are usually consequences of it
    if (m_errorString.isEmpty()) {
        qWarning() << "Pdf::Writer:" << message;
        m_errorString = message;
    }
}

void Writer::writeRaw(const QByteArray &bytes)
{
    if (!m_open) {
        setError(QStringLiteral("write on a closed writer"));
        return;
    }
    if (m_buffer) {
        m_buffer->append(bytes);
    } else if (m_file->write(bytes) != bytes.size()) {
        setError(QStringLiteral("write to %1 failed: %2")
                     .arg(m_file->fileName(), m_file->errorString()));
        return;
    }
    m_bytesWritten += bytes.size();
}

void Writer::write(const QByteArray &bytes)
{
    writeRaw(bytes);
}

void Writer::writeHeader()
{
    write("%PDF-1.7\n");
    write("%\xc7\xec\x8f\xa2\n"); // high-bit bytes to signal binary
}

void Writer::writeXrefAndTrailer()
{
    while (static_cast<ObjId>(m_xref.size()) < m_objCounter)
        m_xref.append(0);
    for (ObjId id = 1; id < m_objCounter; ++id) {
        if (m_xref[id] == 0)
            setError(QStringLiteral("object %1 was reserved but never written").arg(id));
    }

    qint64 startXref = m_bytesWritten;
    write("xref\n");
    write("0 " + toPdf(m_objCounter) + "\n");
    write("0000000000 65535 f \n");
    for (ObjId id = 1; id < m_objCounter; ++id) {
        QByteArray offset = QByteArray::number(m_xref[id]);
        while (offset.length() < 10)
            offset.prepend('0');
        write(offset + " 00000 n \n");
    }
    write("trailer\n<<\n");
    write("/Size " + toPdf(m_objCounter) + "\n");
    QByteArray idHex = toHexString(m_fileId);
    write("/Root " + toObjRef(m_catalogObj) + "\n");
    write("/Info " + toObjRef(m_infoObj) + "\n");
    write("/ID [" + idHex + idHex + "]\n");
    write(">>\nstartxref\n");
    write(toPdf(startXref) + "\n%%EOF\n");
}

void Writer::writeResourceDict(const ResourceDict &dict)
{
    write("<< /ProcSet [/PDF /Text /ImageC]\n");
    if (!dict.fonts.isEmpty()) {
        write("/Font <<\n");
        for (auto it = dict.fonts.begin(); it != dict.fonts.end(); ++it)
            write(toName(it.key()) + " " + toObjRef(it.value()) + "\n");
        write(">>\n");
    }
    if (!dict.xObjects.isEmpty()) {
        write("/XObject <<\n");
        for (auto it = dict.xObjects.begin(); it != dict.xObjects.end(); ++it)
            write(toName(it.key()) + " " + toObjRef(it.value()) + "\n");
        write(">>\n");
    }
    write(">>\n");
}

ObjId Writer::reserveObjects(unsigned int n)
{
    ObjId result = m_objCounter;
    m_objCounter += n;
    return result;
}

void Writer::startObj(ObjId id)
{
    if (m_currentObj != 0)
        setError(QStringLiteral("object %1 started inside object %2").arg(id).arg(m_currentObj));
    m_currentObj = id;
    while (static_cast<ObjId>(m_xref.size()) <= id)
        m_xref.append(0);
    m_xref[id] = m_bytesWritten;
    write(toPdf(id) + " 0 obj\n");
}

ObjId Writer::startObj()
{
    ObjId id = newObject();
    startObj(id);
    return id;
}

void Writer::endObj(ObjId id)
{
    if (m_currentObj != id)
        setError(QStringLiteral("object %1 ended while %2 is open").arg(id).arg(m_currentObj));
    m_currentObj = 0;
    write("\nendobj\n");
}

// Expects the stream dictionary to be open ("<<" already written, no ">>").
void Writer::endObjectWithStream(ObjId id, const QByteArray &streamContent, bool compress)
{
    QByteArray data = streamContent;
    bool compressed = false;
    if (compress && streamContent.size() > 128) {
        uLongf destLen = compressBound(static_cast<uLong>(streamContent.size()));
        QByteArray deflated;
        deflated.resize(static_cast<int>(destLen));
        int zret = ::compress2(reinterpret_cast<Bytef *>(deflated.data()), &destLen,
                               reinterpret_cast<const Bytef *>(streamContent.constData()),
                               static_cast<uLong>(streamContent.size()), Z_DEFAULT_COMPRESSION);
        if (zret == Z_OK) {
            deflated.resize(static_cast<int>(destLen));
            data = deflated;
            compressed = true;
        } else {
            qWarning() << "Pdf::Writer: compress2 failed with" << zret
                       << "- writing object" << id << "uncompressed";
        }
    }

    write("/Length " + toPdf(data.size()) + "\n");
    if (compressed)
        write("/Filter /FlateDecode\n");
    write(">>\nstream\n");
    write(data);
    write("\nendstream");
    endObj(id);
}

} // namespace Pdf
