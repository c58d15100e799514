#pragma once

/*
    GPURT РЕНДЕРЕР САН

    ФАЙЛ: wait_group.hpp
    МОДУЛЬ: job
    ЗОРИЛГО: Тараасан ажлуудыг бүгд дуустал хүлээнэ. Ажил exception шидвэл
            эхнийхийг нь хадгалж wait() дээр дуудагч thread-д дахин шиднэ.
*/


#include <condition_variable>
#include <exception>
#include <mutex>

namespace gpurt
{
    class WaitGroup
    {
    public:
        void add(int n = 1)
        {
            std::lock_guard<std::mutex> guard(lock_);
            outstanding_ += n;
        }

        // Runs one added task; worker threads never see its exception.
        template<typename Fn>
        void run(Fn&& fn)
        {
            try
            {
                fn();
            }
            catch (...)
            {
                std::lock_guard<std::mutex> guard(lock_);
                if (!failure_) failure_ = std::current_exception();
            }
            done();
        }

        void done()
        {
            std::lock_guard<std::mutex> guard(lock_);
            if (--outstanding_ <= 0) finished_.notify_all();
        }

        // Rethrows the first task failure after every task has finished.
        void wait()
        {
            std::unique_lock<std::mutex> guard(lock_);
            finished_.wait(guard, [this]() { return outstanding_ <= 0; });
            if (failure_)
            {
                std::exception_ptr failure = failure_;
                failure_ = nullptr;
                guard.unlock();
                std::rethrow_exception(failure);
            }
        }

    private:
        std::mutex lock_{};
        std::condition_variable finished_{};
        int outstanding_ = 0;
        std::exception_ptr failure_{};
    };
}
