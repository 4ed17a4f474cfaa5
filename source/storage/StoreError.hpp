#ifndef QUADRA_STORAGE_STOREERROR_HPP
#define QUADRA_STORAGE_STOREERROR_HPP

#include <QString>
#include <stdexcept>

class StoreError : public std::runtime_error {
public:
    enum class Kind {
        Validation,     // bad caller input, detected before any write
        Conflict,       // unique name collision
        NotFound,       // update/delete touched no row
        Infrastructure  // open/migrate/engine failure
    };

    StoreError(Kind kind, const QString &message)
        : std::runtime_error(message.toStdString()), m_kind(kind), m_message(message) {}

    Kind kind() const { return m_kind; }
    const QString &message() const { return m_message; }

    static StoreError validation(const QString &message) {
        return StoreError(Kind::Validation, message);
    }
    static StoreError conflict(const QString &message) {
        return StoreError(Kind::Conflict, message);
    }
    static StoreError notFound(const QString &message) {
        return StoreError(Kind::NotFound, message);
    }
    // `operation` names what was attempted, `detail` is the engine text.
    static StoreError infrastructure(const QString &operation, const QString &detail = {}) {
        return StoreError(Kind::Infrastructure,
                          detail.isEmpty() ? operation : operation + QStringLiteral(": ") + detail);
    }

private:
    Kind m_kind;
    QString m_message;
};

#endif // QUADRA_STORAGE_STOREERROR_HPP
