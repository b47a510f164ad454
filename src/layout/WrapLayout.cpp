#include "WrapLayout.h"
#include <algorithm>

using namespace tessel;

std::vector<WrapRun> WrapLayout::pack(const std::vector<float>& majors, const std::vector<float>& minors, float gap, float maxMajor)
{
    std::vector<WrapRun> runs;
    WrapRun run;
    for (std::size_t i = 0; i < majors.size(); ++i) {
        if (run.end > run.start) {
            if (run.major + gap + majors[i] <= maxMajor) {
                run.major += gap + majors[i];
                run.minor = std::max(run.minor, minors[i]);
                run.end = i + 1;
                continue;
            }
            runs.push_back(run);
        }
        run = { i, i + 1, majors[i], minors[i] };
    }
    if (run.end > run.start) {
        runs.push_back(run);
    }
    return runs;
}

Size WrapLayout::layout(const Space& space, std::size_t count, const MeasureFunction& measure, std::vector<Point>& offsets) const
{
    offsets.assign(count, Point { 0.f, 0.f });

    const float minMajor = axisMajor(axis, space.min);
    const float maxMajor = axisMajor(axis, space.max);
    const float minMinor = axisMinor(axis, space.min);
    const float maxMinor = axisMinor(axis, space.max);

    if (count == 0) {
        return axisPack(axis, minMajor, minMinor);
    }

    std::vector<float> majors(count);
    std::vector<float> minors(count);
    for (std::size_t i = 0; i < count; ++i) {
        const Size size = measure(i, Space::unbounded());
        majors[i] = axisMajor(axis, size);
        minors[i] = axisMinor(axis, size);
    }

    const float gap = majorGap();
    const float crossGap = minorGap();
    const std::vector<WrapRun> runs = pack(majors, minors, gap, maxMajor);

    float runMajor = 0.f;
    float runMinors = crossGap * static_cast<float>(runs.size() - 1);
    std::vector<float> runSizes;
    runSizes.reserve(runs.size());
    for (const WrapRun& run : runs) {
        runMajor = std::max(runMajor, run.major);
        runMinors += run.minor;
        runSizes.push_back(run.minor);
    }

    const float major = std::max(std::min(runMajor, maxMajor), minMajor);
    const float minor = std::max(std::min(runMinors, maxMinor), minMinor);

    const std::vector<float> runPositions = tessel::justify(justifyCross, runSizes, minor, crossGap);
    for (std::size_t r = 0; r < runs.size(); ++r) {
        const WrapRun& run = runs[r];
        const std::vector<float> runMajors(majors.begin() + run.start, majors.begin() + run.end);
        const std::vector<float> positions = tessel::justify(justify, runMajors, major, gap);
        for (std::size_t i = run.start; i < run.end; ++i) {
            offsets[i] = axisPackPoint(axis, positions[i - run.start],
                                       runPositions[r] + tessel::align(align, run.minor, minors[i]));
        }
    }

    return axisPack(axis, major, minor);
}
