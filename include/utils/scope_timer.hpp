#if __INTELLISENSE__
#undef __ARM_NEON
#undef __ARM_NEON__
#endif

#ifndef HOMCELL_SCOPE_TIMER_HPP
#define HOMCELL_SCOPE_TIMER_HPP

#include <iostream>
#include <chrono>
#include <string>

namespace utils{
    // prints "<name> took: N ms" when it goes out of scope; silent when disabled
    class ScopeTimer{
    
    private:
        std::string name;
        bool enabled;
        std::chrono::high_resolution_clock::time_point start;

    public:
        ScopeTimer(const std::string& timer_name, bool timer_enabled = true) 
            : name(timer_name), enabled(timer_enabled), start(std::chrono::high_resolution_clock::now()) {}

        // elapsed milliseconds since construction
        double elapsed() const {
            auto now = std::chrono::high_resolution_clock::now();
            return std::chrono::duration_cast<std::chrono::microseconds>(now - start).count() / 1000.0;
        }
        
        ~ScopeTimer() {
            if (!enabled) {
                return;
            }
            auto end = std::chrono::high_resolution_clock::now();
            auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
            std::cout << name << " took: " << duration << " ms" << std::endl;
        }
    };
}

#endif
