#pragma once

#ifdef _WIN32
# ifndef WIN32_LEAN_AND_MEAN
#  define WIN32_LEAN_AND_MEAN
# endif
# ifndef NOMINMAX
#  define NOMINMAX
# endif
# include <windows.h>
#else
# include <pthread.h>
# ifdef __APPLE__
#  include <mach/mach.h>
# else
#  include <semaphore.h>
# endif
#endif

namespace vrb {
namespace sync {

//---------------------- mutex -------------------------//

class mutex {
public:
    mutex();
    ~mutex();
    mutex(const mutex&) = delete;
    mutex& operator=(const mutex&) = delete;
    void lock();
    bool try_lock();
    void unlock();
private:
#ifdef _WIN32
    SRWLOCK mutex_;
#else
    pthread_mutex_t mutex_;
#endif
};

//------------------------ locks ------------------------//

template<typename T>
class scoped_lock {
public:
    scoped_lock(T& mutex)
        : mutex_(&mutex){ mutex_->lock(); }
    scoped_lock(const scoped_lock&) = delete;
    scoped_lock& operator=(const scoped_lock&) = delete;
    ~scoped_lock(){ mutex_->unlock(); }
private:
    T* mutex_;
};

//---------------------- semaphore ---------------------//

class semaphore {
public:
    semaphore();
    ~semaphore();
    semaphore(const semaphore&) = delete;
    semaphore& operator=(const semaphore&) = delete;
    // async-signal-safe
    void post();
    void wait();
    bool try_wait();
    // returns false on timeout
    bool wait_for(double seconds);
private:
#ifdef _WIN32
    HANDLE sem_;
#elif defined(__APPLE__)
    semaphore_t sem_;
#else
    sem_t sem_;
#endif
};

} // sync
} // vrb
