#include "Smoke/SmokeSupport.h"

#include <iostream>

int main()
{
    std::vector<AriesSmoke::SmokeTest> tests;
    for (auto&& group : { AriesSmoke::geometryTests(),
                          AriesSmoke::storeTests(),
                          AriesSmoke::historyTests(),
                          AriesSmoke::persistenceTests(),
                          AriesSmoke::interactionTests(),
                          AriesSmoke::viewTests(),
                          AriesSmoke::runtimeTests() })
    {
        tests.insert(tests.end(), group.begin(), group.end());
    }

    for (const auto& [name, run] : tests)
    {
        const auto result = run();
        if (result.failed())
        {
            std::cerr << "[FAIL] " << name << ": " << result.getErrorMessage() << std::endl;
            return 1;
        }

        std::cout << "[PASS] " << name << std::endl;
    }

    std::cout << "Aries grid smoke passed (" << tests.size() << " tests)." << std::endl;
    return 0;
}
