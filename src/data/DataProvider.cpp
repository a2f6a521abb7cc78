#include "cadence/data/DataProvider.hpp"

#include "cadence/core/Logging.hpp"
#include "cadence/data/FileInstanceRepository.hpp"
#include "cadence/data/FileSeriesRepository.hpp"
#include "cadence/data/FileSeriesStorage.hpp"

#include <QDir>
#include <QStandardPaths>

namespace cadence {
namespace data {

DataProvider::DataProvider(const QString &filePath)
    : m_storagePath(filePath.isEmpty() ? defaultStoragePath() : filePath)
{
    m_storage = std::make_shared<FileSeriesStorage>(m_storagePath);
    m_seriesRepository = std::make_unique<FileSeriesRepository>(m_storage);
    m_instanceRepository = std::make_unique<FileInstanceRepository>(m_storage);
    qCDebug(lcCadenceStorage) << "using store" << m_storagePath;
}

DataProvider::~DataProvider() = default;

QString DataProvider::defaultStoragePath()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/cadence");
    }
    QDir dir(storageFolder);
    if (!dir.exists()) {
        dir.mkpath(QStringLiteral("."));
    }
    return dir.filePath(QStringLiteral("series.ics"));
}

const QString &DataProvider::storagePath() const
{
    return m_storagePath;
}

SeriesRepository &DataProvider::seriesRepository()
{
    return *m_seriesRepository;
}

InstanceRepository &DataProvider::instanceRepository()
{
    return *m_instanceRepository;
}

} // namespace data
} // namespace cadence
