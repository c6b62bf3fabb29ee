#include "BomError.h"

BomError::BomError()
    : m_type(NoError) {}

BomError::BomError(ErrorType type, const QString &text)
    : m_type(type), m_text(text) {}

BomError::ErrorType BomError::type() const { return m_type; }
QString BomError::text() const { return m_text; }

bool BomError::isValid() const {
    return m_type != NoError;
}

QString BomError::typeName(ErrorType type) {
    switch (type) {
    case NoError: return QStringLiteral("NoError");
    case NotFoundError: return QStringLiteral("NotFoundError");
    case ConfigurationError: return QStringLiteral("ConfigurationError");
    case TenantMismatchError: return QStringLiteral("TenantMismatchError");
    case ConcurrencyConflict: return QStringLiteral("ConcurrencyConflict");
    case InvalidStateTransitionError: return QStringLiteral("InvalidStateTransitionError");
    case InsufficientStockError: return QStringLiteral("InsufficientStockError");
    case StorageError: return QStringLiteral("StorageError");
    }
    return QStringLiteral("UnknownError");
}

bool BomError::report(BomError *out, ErrorType type, const QString &text) {
    if (out) *out = BomError(type, text);
    return false;
}

void BomError::clear(BomError *out) {
    if (out) *out = BomError();
}
