/* Copyright (c) 2010-Now Christof Ressi, Winfried Ritsch and others.
 * For information on usage and redistribution, and for a DISCLAIMER OF ALL
 * WARRANTIES, see the file, "LICENSE.txt," in this distribution.  */

#include "sync.hpp"

#include <climits>

#ifndef _WIN32
# include <errno.h>
# include <time.h>
#endif

namespace vrb {
namespace sync {

#ifdef _WIN32

//---------------------- mutex -------------------------//

mutex::mutex() { InitializeSRWLock(&mutex_); }

mutex::~mutex() {}

void mutex::lock() { AcquireSRWLockExclusive(&mutex_); }

bool mutex::try_lock() { return TryAcquireSRWLockExclusive(&mutex_) != 0; }

void mutex::unlock() { ReleaseSRWLockExclusive(&mutex_); }

//---------------------- semaphore ---------------------//

semaphore::semaphore() {
    sem_ = CreateSemaphoreA(nullptr, 0, LONG_MAX, nullptr);
}

semaphore::~semaphore() {
    CloseHandle(sem_);
}

void semaphore::post() {
    ReleaseSemaphore(sem_, 1, nullptr);
}

void semaphore::wait() {
    WaitForSingleObject(sem_, INFINITE);
}

bool semaphore::try_wait() {
    return WaitForSingleObject(sem_, 0) == WAIT_OBJECT_0;
}

bool semaphore::wait_for(double seconds) {
    return WaitForSingleObject(sem_, (DWORD)(seconds * 1000)) == WAIT_OBJECT_0;
}

#else

//---------------------- mutex -------------------------//

mutex::mutex() { pthread_mutex_init(&mutex_, nullptr); }

mutex::~mutex() { pthread_mutex_destroy(&mutex_); }

void mutex::lock() { pthread_mutex_lock(&mutex_); }

bool mutex::try_lock() { return pthread_mutex_trylock(&mutex_) == 0; }

void mutex::unlock() { pthread_mutex_unlock(&mutex_); }

//---------------------- semaphore ---------------------//

// NB: post() only calls sem_post() resp. semaphore_signal(),
// so it may be called from a signal handler.

#ifdef __APPLE__

semaphore::semaphore() {
    semaphore_create(mach_task_self(), &sem_, SYNC_POLICY_FIFO, 0);
}

semaphore::~semaphore() {
    semaphore_destroy(mach_task_self(), sem_);
}

void semaphore::post() {
    semaphore_signal(sem_);
}

void semaphore::wait() {
    while (semaphore_wait(sem_) == KERN_ABORTED) {}
}

bool semaphore::try_wait() {
    return wait_for(0);
}

bool semaphore::wait_for(double seconds) {
    mach_timespec_t ts;
    ts.tv_sec = (unsigned int)seconds;
    ts.tv_nsec = (clock_res_t)((seconds - ts.tv_sec) * 1e9);
    // KERN_OPERATION_TIMED_OUT on timeout
    return semaphore_timedwait(sem_, ts) == KERN_SUCCESS;
}

#else

semaphore::semaphore() {
    sem_init(&sem_, 0, 0);
}

semaphore::~semaphore() {
    sem_destroy(&sem_);
}

void semaphore::post() {
    sem_post(&sem_);
}

void semaphore::wait() {
    while (sem_wait(&sem_) != 0 && errno == EINTR) {}
}

bool semaphore::try_wait() {
    while (sem_trywait(&sem_) != 0) {
        if (errno != EINTR) {
            return false; // EAGAIN
        }
    }
    return true;
}

bool semaphore::wait_for(double seconds) {
    // sem_timedwait() takes an absolute CLOCK_REALTIME deadline
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    auto nsec = ts.tv_nsec + (long long)(seconds * 1e9);
    ts.tv_sec += nsec / 1000000000;
    ts.tv_nsec = nsec % 1000000000;

    while (sem_timedwait(&sem_, &ts) != 0) {
        if (errno != EINTR) {
            return false; // ETIMEDOUT
        }
    }
    return true;
}

#endif // __APPLE__

#endif

} // sync
} // vrb
