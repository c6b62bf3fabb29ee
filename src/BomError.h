#ifndef BOMERROR_H
#define BOMERROR_H

#include <QString>

// Error value returned by BOM operations, modelled after QSqlError
class BomError {
public:
    enum ErrorType {
        NoError,
        NotFoundError,
        ConfigurationError,
        TenantMismatchError,
        ConcurrencyConflict,
        InvalidStateTransitionError,
        InsufficientStockError,
        StorageError
    };

    BomError();
    BomError(ErrorType type, const QString &text);

    ErrorType type() const;
    QString text() const;

    /// true when an error occurred
    bool isValid() const;

    static QString typeName(ErrorType type);

    // fill `out` when the caller asked for it; always returns false so
    // failing paths can `return fail(...)`
    static bool report(BomError *out, ErrorType type, const QString &text);
    static void clear(BomError *out);

private:
    ErrorType m_type;
    QString m_text;
};

#endif // BOMERROR_H
