#pragma once

#include <exception>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>

namespace doorsid

{

    // marks the end of a THROWF message (optional)
    struct ExceptionEnd {};

    /**
     * Base for all doorsid exceptions
     * the message is composed with the stream operator, e.g.
     * THROWF(doorsid::InputException) << "Invalid key: " << key << THROWF_END;
    */
    class AbstractException : public std::exception
    {
    public:
        AbstractException(int err_id);
        virtual ~AbstractException() = default;

        int getErrorId() const;

        const char *what() const noexcept override;

        template <typename T> void append(const T &value)
        {
            std::ostringstream oss;
            oss << value;
            m_message += oss.str();
        }

        void append(const ExceptionEnd &) {
        }

    private:
        int m_err_id;
        std::string m_message;
    };

    // keeps the static (most derived) exception type through the whole << chain
    template <typename ExceptionT, typename T,
        typename = std::enable_if_t<std::is_base_of_v<AbstractException, std::decay_t<ExceptionT> > > >
    std::decay_t<ExceptionT> &&operator<<(ExceptionT &&e, const T &value)
    {
        e.append(value);
        return std::move(e);
    }

}

#define THROWF(ExceptionT) throw ExceptionT()
#define THROWF_END doorsid::ExceptionEnd()
