/**
 * @file  handoff_error_table.h
 *
 * @brief Defines ERRORS for the handoff sender and its transports
 */

#ifndef HANDOFF_ERROR_TABLE_H__
#define HANDOFF_ERROR_TABLE_H__

/**
 * @defgroup error_codes Handoff ERROR Codes
 * @note ERROR code format:
 *
 *      -mmmmnnn
 *
 * Example:    SYS_SOCK_OPEN_ERR -100000
 *
 * Where -mmmm000 is a handoff ERROR Code and nnn is the errno
 * associated with the failing system call, if any.
 *
 * If the errno is 104, the error returned is -100104.
 */

#ifdef MAKE_HANDOFF_ERROR_MAP
#include <map>
#include <string>
namespace {
    namespace handoff_error_map_construction {
        std::map<const int, const std::string> handoff_error_map;
        std::map<const std::string, const int> handoff_error_name_map;

        //We pass the variable as a const reference here to silence
        //unused variable warnings in a controlled manner
        int create_error( const std::string& err_name, const int err_code, const int& ) {
            handoff_error_map.insert( std::pair<const int, const std::string>( err_code, err_name ) );
            handoff_error_name_map.insert( std::pair<const std::string, const int>( err_name, err_code ) );
            return err_code;
        }
    }
}
#define NEW_ERROR(err_name, err_code) const int err_name = handoff_error_map_construction::create_error( #err_name, err_code, err_name );
#else
#define NEW_ERROR(err_name, err_code) err_name = err_code,
enum HANDOFF_ERROR_ENUM
{
#endif

// clang-format off

/* 1,000 - 99,000 - system type */
/** @defgroup system_errors System ERRORs
 *  @ingroup error_codes
 *  ERROR Code Range 1,000 - 99,000
 * @{
 */
NEW_ERROR(SYS_INTERNAL_ERR,                            -1000)
NEW_ERROR(SYS_INVALID_INPUT_PARAM,                     -2000)
NEW_ERROR(SYS_CONFIG_FILE_ERR,                         -3000)
NEW_ERROR(KEY_NOT_FOUND,                               -4000)
NEW_ERROR(KEY_TYPE_MISMATCH,                           -5000)
/** @} */

/* 100,000 - 199,000 - socket type */
/** @defgroup socket_errors Socket ERRORs
 *  @ingroup error_codes
 *  ERROR Code Range 100,000 - 199,000
 * @{
 */
NEW_ERROR(SYS_SOCK_OPEN_ERR,                           -100000)
NEW_ERROR(SYS_SOCK_CONNECT_ERR,                        -101000)
NEW_ERROR(SYS_SOCK_CONNECT_TIMEDOUT,                   -102000)
NEW_ERROR(SYS_SOCK_READ_TIMEDOUT,                      -103000)
NEW_ERROR(SYS_SOCK_READ_ERR,                           -104000)
NEW_ERROR(SYS_SOCK_WRITE_TIMEDOUT,                     -105000)
NEW_ERROR(SYS_SOCK_WRITE_ERR,                          -106000)
NEW_ERROR(SYS_SOCK_CLOSED,                             -107000)
NEW_ERROR(SYS_SOCK_NOT_OPEN,                           -108000)
NEW_ERROR(SYS_FRAME_LEN_ERR,                           -109000)
NEW_ERROR(SYS_HOST_RESOLUTION_ERR,                     -110000)
/** @} */

/* 200,000 - 299,000 - ssl type */
/** @defgroup ssl_errors SSL ERRORs
 *  @ingroup error_codes
 *  ERROR Code Range 200,000 - 299,000
 * @{
 */
NEW_ERROR(SSL_INIT_ERROR,                              -200000)
NEW_ERROR(SSL_HANDSHAKE_ERROR,                         -201000)
NEW_ERROR(SSL_CERT_ERROR,                              -202000)
NEW_ERROR(SSL_CONFIG_FILE_ERR,                         -203000)
NEW_ERROR(SSL_SHUTDOWN_ERROR,                          -204000)
/** @} */

/* 300,000 - 399,000 - handoff type */
/** @defgroup handoff_errors Handoff ERRORs
 *  @ingroup error_codes
 *  ERROR Code Range 300,000 - 399,000
 * @{
 */
NEW_ERROR(HANDOFF_LISTENER_LOOKUP_ERR,                 -300000)
NEW_ERROR(HANDOFF_INVALID_NODE_NAME,                   -301000)
NEW_ERROR(HANDOFF_MAX_CONCURRENCY,                     -302000)
NEW_ERROR(HANDOFF_TIMEOUT,                             -303000)
NEW_ERROR(HANDOFF_UNEXPECTED_REPLY,                    -304000)
NEW_ERROR(HANDOFF_ENCODING_ERR,                        -305000)
NEW_ERROR(HANDOFF_FOLD_ENGINE_ERR,                     -306000)
NEW_ERROR(HANDOFF_TRANSPORT_ERR,                       -307000)
/** @} */
#ifndef MAKE_HANDOFF_ERROR_MAP
};
#endif

// clang-format on

#endif /* HANDOFF_ERROR_TABLE_H__ */
