#pragma once

#include <memory>
#include <QString>

namespace cadence {
namespace data {

class SeriesRepository;
class InstanceRepository;
class FileSeriesStorage;

class DataProvider
{
public:
    // An empty path selects defaultStoragePath().
    explicit DataProvider(const QString &filePath = QString());
    ~DataProvider();

    static QString defaultStoragePath();

    const QString &storagePath() const;
    SeriesRepository &seriesRepository();
    InstanceRepository &instanceRepository();

private:
    QString m_storagePath;
    std::shared_ptr<FileSeriesStorage> m_storage;
    std::unique_ptr<SeriesRepository> m_seriesRepository;
    std::unique_ptr<InstanceRepository> m_instanceRepository;
};

} // namespace data
} // namespace cadence
