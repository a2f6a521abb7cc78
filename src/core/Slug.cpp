#include "cadence/core/Slug.hpp"

#include "cadence/core/Logging.hpp"

#include <QRegularExpression>

namespace cadence {
namespace core {

QString slugify(const QString &text)
{
    static const QRegularExpression nonAlphanumeric(QStringLiteral("[^a-z0-9]+"));
    static const QRegularExpression edgeDashes(QStringLiteral("^-+|-+$"));

    QString slug = text.toLower();
    slug.replace(nonAlphanumeric, QStringLiteral("-"));
    slug.remove(edgeDashes);
    return slug;
}

SlugAllocator::SlugAllocator(QSet<QString> takenSlugs)
    : m_taken(std::move(takenSlugs))
{
}

QString SlugAllocator::allocate(const QString &base, const QString &date)
{
    const QString stem = base.isEmpty() ? date : QStringLiteral("%1-%2").arg(base, date);
    QString slug = stem;
    for (int suffix = 2; m_taken.contains(slug); ++suffix) {
        slug = QStringLiteral("%1-%2").arg(stem).arg(suffix);
    }
    if (slug != stem) {
        qCDebug(lcCadenceReconciler) << "slug" << stem << "taken, using" << slug;
    }
    m_taken.insert(slug);
    return slug;
}

void SlugAllocator::reserve(const QString &slug)
{
    if (!slug.isEmpty()) {
        m_taken.insert(slug);
    }
}

void SlugAllocator::release(const QString &slug)
{
    m_taken.remove(slug);
}

} // namespace core
} // namespace cadence
