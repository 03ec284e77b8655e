#include <iostream>
#include <iomanip> // 用于控制输出格式
#include "vessel.hpp"
#include "cpa.hpp"
#include "collision_course.hpp"
#include "risk.hpp"

static void print_cpa(const char* name, const CpaResult& r)
{
    std::cout << "\n--- " << name << " ---\n";
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "  status  = " << toString(r.status) << "\n";
    std::cout << "  TCPA    = " << r.tcpa << "\n";
    std::cout << "  目标@CPA = (" << r.target_at_cpa.x() << ", " << r.target_at_cpa.y() << ")\n";
    std::cout << "  本船@CPA = (" << r.ownship_at_cpa.x() << ", " << r.ownship_at_cpa.y() << ")\n";
    std::cout << "  距离    = " << r.range_at_cpa << "\n";
    std::cout << "  方位    = " << r.bearing_at_cpa << "\n";
}

int main()
{
    // -----------------------------
    // 1. 对遇 (head-on)
    // -----------------------------
    Vessel ownship(10.0, 0.0, 0.0, 10.0, 90.0);
    Vessel head_on(10.0, 100.0, 0.0, 10.0, 270.0);
    print_cpa("对遇", ownship.cpa(head_on));

    // -----------------------------
    // 2. 交叉相遇
    // -----------------------------
    Vessel north_bound(10.0, 0.0, 0.0, 10.0, 0.0);
    Vessel crossing(10.0, 10.0, 100.0, 10.0, 180.0);
    print_cpa("交叉", north_bound.cpa(crossing));

    // -----------------------------
    // 3. 同速同向 (相对静止)
    // -----------------------------
    Vessel follower(10.0, 0.0, -50.0, 10.0, 0.0);
    print_cpa("同向", north_bound.cpa(follower));

    // -----------------------------
    // 4. 碰撞航向
    // -----------------------------
    Vessel drifting(10.0, 0.0, 0.0, 0.0, 0.0);
    Vessel intruder(10.0, 50.0, 0.0, 0.0, 0.0);

    CollisionCourseConfig cc_config;
    cc_config.num_solutions = 10;
    cc_config.min_speed = 2.0;
    cc_config.max_speed = 25.0;

    CollisionCourseResult courses = drifting.coursesToCollide(intruder, cc_config);
    if (!courses.ok()) {
        std::cerr << "碰撞航向求解失败: " << toString(courses.status) << "\n";
        return -1;
    }

    std::cout << "\n================ 碰撞航向 ================\n";
    for (size_t k = 0; k < courses.solutions.size(); ++k) {
        const auto& s = courses.solutions[k];
        std::cout << "  [" << k << "] speed = " << std::setprecision(2) << s.speed
                  << ", heading = " << s.heading
                  << ", t = " << s.time_to_intercept << "\n";
    }
    std::cout << "==========================================\n";

    // -----------------------------
    // 5. 碰撞风险
    // -----------------------------
    CollisionRisk risk = assessCollisionRisk(north_bound, crossing);
    std::cout << "\n风险等级: " << toString(risk.level)
              << " (t = " << risk.time << ", range = " << risk.range << ")\n";

    return 0;
}
