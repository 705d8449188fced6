#pragma once
#include <vector>

#include "geometry.h"

namespace bpocv
{
namespace test
{

    /// Five equal bars, 20 px wide and 50 px tall, top edge at y = 50.
    inline std::vector<DataItem> reference_data()
    {
        return {
            { 10, 50, 20, 50, 100, "test1" },
            { 50, 50, 20, 50, 200, "test2" },
            { 90, 50, 20, 50, 300, "test3" },
            { 130, 50, 20, 50, 400, "test4" },
            { 170, 50, 20, 50, 500, "test5" },
        };
    }

    /// Two bars carrying their own background descriptors.
    inline std::vector<DataItem> background_data()
    {
        return {
            { 10, 50, 20, 20, 40, "test", Geometry{ 10, 50, 20, 50 } },
            { 50, 50, 20, 50, 100, "test", Geometry{ 50, 50, 20, 50 } },
        };
    }

} // namespace test
} // namespace bpocv
