#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef FEM1D_SCOPE_TIMER_HPP
#define FEM1D_SCOPE_TIMER_HPP

#include <chrono>
#include <iostream>
#include <string>

namespace utils{
    // Prints the wall-clock time of the enclosing scope on destruction
    class ScopeTimer{
    
    private:
        std::string name;
        std::ostream& out;
        std::chrono::steady_clock::time_point start;

    public:
        explicit ScopeTimer(const std::string& timer_name, std::ostream& stream = std::cout) 
            : name(timer_name), out(stream), start(std::chrono::steady_clock::now()) {}

        ScopeTimer(const ScopeTimer&) = delete;
        ScopeTimer& operator=(const ScopeTimer&) = delete;

        double elapsed_ms() const {
            auto now = std::chrono::steady_clock::now();
            return std::chrono::duration<double, std::milli>(now - start).count();
        }
        
        ~ScopeTimer() {
            out << name << " took: " << elapsed_ms() << " ms" << std::endl;
        }
    };
}

#endif
