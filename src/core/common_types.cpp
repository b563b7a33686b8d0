#include "core/common_types.h"

QString garmentCategoryName(GarmentCategory category)
{
    switch (category) {
    case GarmentCategory::Upper:
        return QStringLiteral("upper");
    case GarmentCategory::Lower:
        return QStringLiteral("lower");
    case GarmentCategory::Full:
        return QStringLiteral("full");
    }
    return QStringLiteral("upper");
}

std::optional<GarmentCategory> parseGarmentCategory(const QString &name)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("upper")) {
        return GarmentCategory::Upper;
    }
    if (key == QLatin1String("lower")) {
        return GarmentCategory::Lower;
    }
    if (key == QLatin1String("full") || key == QLatin1String("overall")) {
        return GarmentCategory::Full;
    }
    return std::nullopt;
}
