// __________________________________ CONTENTS ___________________________________
//
//    Common utils / includes / namespaces used for testing.
//    Reduces test boilerplate, should not be included anywhere else.
// _______________________________________________________________________________

// ___________________ TEST FRAMEWORK  ____________________

#define DOCTEST_CONFIG_VOID_CAST_EXPRESSIONS // makes 'CHECK_THROWS()' not give warning for discarding [[nodiscard]]
#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN   // automatically creates 'main()' that runs tests
#include <doctest/doctest.h>

// ___________________ HELPERS  ____________________

#include <cmath>
#include <cstddef>
#include <vector>

[[nodiscard]] inline double sample_mean(const std::vector<double>& values) {
    double sum = 0;
    for (const double value : values) sum += value;
    return sum / static_cast<double>(values.size());
}

[[nodiscard]] inline double sample_variance(const std::vector<double>& values) {
    const double mean = sample_mean(values);

    double sum = 0;
    for (const double value : values) sum += (value - mean) * (value - mean);
    return sum / static_cast<double>(values.size() - 1);
}
