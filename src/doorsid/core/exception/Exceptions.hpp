#pragma once

#include <doorsid/core/exception/AbstractException.hpp>

namespace doorsid

{

    namespace EXCEPTION_ID_PREFIX  {

        enum : int {
            // common exceptions
            BASIC = 0x00000000,
            // identifier codec exceptions
            CODEC = 0x00000100,
            // identifier translation exceptions
            TRANSLATION = 0x00000200
        };

    }

    class CriticalException : public AbstractException {
    public:	
        static constexpr int exception_id = EXCEPTION_ID_PREFIX::BASIC | 0x00caffee;

        CriticalException(int err_id = exception_id);
    };
        
    class RecoverableException : public AbstractException {
    public:	
        static constexpr int exception_id = EXCEPTION_ID_PREFIX::BASIC | 0x0000beef;

        RecoverableException(int err_id);
        virtual ~RecoverableException() = default;
    };

    // reading the wrong alternative of a variant or similar misuse
    class InternalException : public CriticalException {
    public:
        static constexpr int exception_id = EXCEPTION_ID_PREFIX::BASIC | 0x01;

        InternalException(int err_id = exception_id);
    };
    
    class InputException : public RecoverableException {
    public:
        static constexpr int exception_id = EXCEPTION_ID_PREFIX::BASIC | 0x03;

        InputException(int err_id = exception_id);
        virtual ~InputException() = default;
    };
        
    class KeyNotFoundException : public InputException {
    public :
        static constexpr int exception_id = EXCEPTION_ID_PREFIX::BASIC | 0x09;

        KeyNotFoundException(int err_id = exception_id);
    };

}
