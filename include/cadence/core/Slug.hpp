#pragma once

#include <QSet>
#include <QString>

namespace cadence {
namespace core {

QString slugify(const QString &text);

// Hands out "<base>-<date>" slugs that are unique against the store's
// current slugs and against every slug handed out earlier by the same
// allocator. Collisions get "-2", "-3", ... appended.
class SlugAllocator
{
public:
    explicit SlugAllocator(QSet<QString> takenSlugs = {});

    QString allocate(const QString &base, const QString &date);
    void reserve(const QString &slug);
    void release(const QString &slug);

private:
    QSet<QString> m_taken;
};

} // namespace core
} // namespace cadence
