#include "AbstractException.hpp"

namespace doorsid

{

    AbstractException::AbstractException(int err_id)
        : m_err_id(err_id)
    {
    }

    int AbstractException::getErrorId() const {
        return m_err_id;
    }

    const char *AbstractException::what() const noexcept {
        return m_message.c_str();
    }

}
