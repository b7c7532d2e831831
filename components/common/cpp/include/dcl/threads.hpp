#ifndef _DCL_THREADS_HPP_
#define _DCL_THREADS_HPP_

#include <mutex>
#include <shared_mutex>
#include <ctpl_stl.h>

#define MUTEX std::mutex
#define SHARED_MUTEX std::shared_mutex

#define UNIQUE_LOCK(M,L) std::unique_lock<std::remove_reference<decltype(M)>::type> L(M);
#define SHARED_LOCK(M,L) std::shared_lock<std::remove_reference<decltype(M)>::type> L(M);

namespace dcl {
	/** Process wide worker pool, sized by the "threads" option. */
	extern ctpl::thread_pool pool;
}

#endif  // _DCL_THREADS_HPP_
