// Compatibility header for Boost.Asio vs standalone Asio
// When ASIO_STANDALONE is defined (no Boost), we include standalone headers
// and create namespace aliases so the rest of the code can use boost::asio uniformly.
#pragma once

#ifdef ASIO_STANDALONE
    #include <asio.hpp>
    #include <asio/connect.hpp>
    #include <asio/steady_timer.hpp>
    #include <asio/strand.hpp>
    #include <asio/ip/tcp.hpp>
    #include <asio/read_until.hpp>
    #include <asio/streambuf.hpp>
    #include <asio/write.hpp>
    #include <asio/executor_work_guard.hpp>

    namespace boost {
        namespace asio = ::asio;
        namespace system {
            using ::asio::error_code;
        }
    }
#else
    #include <boost/asio.hpp>
    #include <boost/asio/connect.hpp>
    #include <boost/asio/steady_timer.hpp>
    #include <boost/asio/strand.hpp>
    #include <boost/asio/ip/tcp.hpp>
    #include <boost/asio/read_until.hpp>
    #include <boost/asio/streambuf.hpp>
    #include <boost/asio/write.hpp>
    #include <boost/asio/executor_work_guard.hpp>
#endif
