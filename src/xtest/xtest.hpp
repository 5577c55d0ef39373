#pragma once
#include <string>
#include <list>
#include <tuple>
#include <exception>
#include <functional>
#include <iostream>
#ifdef _WIN32
#include <windows.h>
#endif
namespace xtest
{
#ifdef _WIN32
	static inline std::ostream& RED(std::ostream &s)
	{
		HANDLE hStdout = GetStdHandle(STD_OUTPUT_HANDLE);
		SetConsoleTextAttribute(hStdout, FOREGROUND_RED | FOREGROUND_INTENSITY);
		return s;

	}
	static inline std::ostream& GREEN(std::ostream &s)
	{
		HANDLE hStdout = GetStdHandle(STD_OUTPUT_HANDLE);
		SetConsoleTextAttribute(hStdout, FOREGROUND_GREEN | FOREGROUND_INTENSITY);
		return s;
	}
	static inline std::ostream& YELLOW(std::ostream &s)
	{
		HANDLE hStdout = GetStdHandle(STD_OUTPUT_HANDLE);
		SetConsoleTextAttribute(hStdout, FOREGROUND_GREEN | FOREGROUND_RED | FOREGROUND_INTENSITY);
		return s;
	}
	static inline std::ostream& WHITE(std::ostream &s)
	{
		HANDLE hStdout = GetStdHandle(STD_OUTPUT_HANDLE);
		SetConsoleTextAttribute(hStdout,FOREGROUND_RED | FOREGROUND_GREEN | FOREGROUND_BLUE);
		return s;
	}
#else
#define RED     "\033[31m"      /* Red */
#define GREEN   "\033[32m"      /* Green */
#define YELLOW  "\033[33m"      /* Yellow */
#define WHITE   "\033[0m"       /* Reset */
#endif // _WIN32

	class xtest_excetion
	{
	public:
		xtest_excetion(const char *file,int line, const char *errstr)
		{
			error_str_ += "FILE: ";
			error_str_ += file;
			error_str_ += " LINE: ";
			error_str_ += std::to_string(line);
			error_str_ += "  ";
			error_str_ += errstr;
		}
		const char *str() const
		{
			return error_str_.c_str();
		}
	private:
		std::string error_str_;
	};

	class xtest
	{
	public:
		typedef std::tuple<std::string, std::string, std::function<void(void)>> test_t;
		static xtest &get_inst()
		{
			static xtest inst;
			return inst;
		}
		xtest &add_test(const std::string &suite, const std::string &name,std::function<void()> test)
		{
			tests_.emplace_back(suite, name, test);
			return *this;
		}
		//returns the number of failed tests
		int run_test()
		{
			std::string suite;
			int failed = 0;
			for (auto &itr : tests_)
			{
				if (suite != std::get<0>(itr))
				{
					if (suite.size())
						std::cout << "- - - - - - - - - - - - -"<< std::endl;
					std::cout << "suite: " << YELLOW <<
						std::get<0>(itr).c_str() << WHITE << std::endl;
				}

				suite = std::get<0>(itr);
				std::cout << "     |-> " << YELLOW <<std::get<1>(itr).c_str()<<WHITE;
				try
				{
					std::get<2>(itr)();
					std::cout << GREEN<<" ok" << WHITE <<std::endl;
				}
				catch (xtest_excetion &e)
				{
					++failed;
					std::cout << RED <<" failed "<< e.str() << WHITE << std::endl;
				}
				catch (std::exception &e)
				{
					++failed;
					std::cout << RED << " uncaught exception: " << e.what() << WHITE << std::endl;
				}
			}
			std::cout << std::endl << tests_.size() - failed << "/"
				<< tests_.size() << " passed" << std::endl;
			return failed;
		}
	private:
		std::list<test_t> tests_;
	};
}

#define XTEST_SUITE(name) namespace name##_suite{ static const char *__suite_name  = #name; } namespace name##_suite

#define XUNIT_TEST(name) \
static inline void do_##name##_unit_test();\
class unit_test_##name\
{\
public:\
	unit_test_##name()\
	{\
		xtest::xtest::get_inst().add_test(__suite_name, #name, [&] { do_##name##_unit_test();});\
	}\
}_unit_test_##name;\
 void  do_##name##_unit_test()

#define  xassert(x) if (!(x)) throw xtest::xtest_excetion(__FILE__, __LINE__, "xassert( "#x" ) failed !");

#define xassert_throw(x, type) \
{\
	bool __thrown = false;\
	try { x; } catch (const type &) { __thrown = true; }\
	if (!__thrown) throw xtest::xtest_excetion(__FILE__, __LINE__, "xassert_throw( "#x", "#type" ) failed !");\
}

#define XTEST_MAIN \
int main()\
{\
	return xtest::xtest::get_inst().run_test();\
}
